/**
 * @file pngmsg.cpp
 * @brief Hide, read and remove text messages in PNG files
 *
 * Stores a message as a private chunk appended to the file, prints it
 * back, removes it again, or lists every chunk of a file.
 *
 * Usage:
 *   pngmsg encode <file> <type> <message> [output]
 *   pngmsg decode <file> <type>
 *   pngmsg remove <file> <type>
 *   pngmsg print <file>
 */

#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>

namespace {

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " <command> <args>\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <type> <message> [output]  Hide message in a PNG file\n";
        std::cout << "  decode <file> <type>                     Print the hidden message\n";
        std::cout << "  remove <file> <type>                     Remove the hidden message\n";
        std::cout << "  print <file>                             Print all chunks\n";
        std::cout << "\n";
        std::cout << "<type> is a 4-letter chunk type made up of a-z | A-Z, e.g. ruSt\n";
    }

    pngchunk::png load(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            THROW_IO("Cannot open file '", path, "'");
        }
        return pngchunk::png::read(file);
    }

    void save(const pngchunk::png& image, const std::string& path) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            THROW_IO("Cannot create file '", path, "'");
        }
        image.write(file);
    }

    int encode(const std::string& path, const pngchunk::chunk_type& type,
               const std::string& message, const std::string& output) {
        auto image = load(path);

        std::vector<std::byte> data(message.size());
        std::transform(message.begin(), message.end(), data.begin(),
                       [](char c) { return static_cast<std::byte>(c); });
        image.append_chunk(type, std::move(data));

        save(image, output);
        std::cout << "Chunk written successfully.\n";
        return 0;
    }

    int decode(const std::string& path, const pngchunk::chunk_type& type) {
        auto image = load(path);

        const auto* found = image.chunk_by_type(type.to_string_view());
        if (!found) {
            std::cout << "No chunk of type " << type << " found\n";
            return 0;
        }

        std::cout << "Chunk : " << *found << "\n";
        std::cout << "Chunk data : " << found->data_as_string().value_or("{Non UTF-8 data}") << "\n";
        return 0;
    }

    int remove_message(const std::string& path, const pngchunk::chunk_type& type) {
        auto image = load(path);
        auto removed = image.remove_chunk(type.to_string_view());
        save(image, path);
        std::cout << "Removed chunk: " << removed << "\n";
        return 0;
    }

    int print_chunks(const std::string& path) {
        auto image = load(path);
        for (const auto& c : image.chunks()) {
            std::cout << c << "\n";
        }
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string path = argv[2];

    try {
        if (command == "print" && argc == 3) {
            return print_chunks(path);
        }

        if (argc < 4) {
            print_usage(argv[0]);
            return 1;
        }

        // Reject bad type codes before touching any file
        auto type = pngchunk::chunk_type::parse(argv[3]);

        if (command == "encode" && (argc == 5 || argc == 6)) {
            return encode(path, type, argv[4], argc == 6 ? argv[5] : path);
        }
        if (command == "decode" && argc == 4) {
            return decode(path, type);
        }
        if (command == "remove" && argc == 4) {
            return remove_message(path, type);
        }

        print_usage(argv[0]);
        return 1;

    } catch (const pngchunk::type_code_error& e) {
        std::cerr << "Could not parse chunk type: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
