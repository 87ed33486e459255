#include "config/config.hpp"
#include "convert/text_converter.hpp"
#include "docx/docx_reader.hpp"
#include "util/log.hpp"
#include "version.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace taktkb {
namespace {

constexpr const char* kUsage = "Usage: docx_to_text <input_dir> <output_dir>";

void write_text_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("failed to open output file: " + path.string());
    }
    out << text;
    out.flush();
    if (!out) {
        throw std::runtime_error("failed to write output file: " + path.string());
    }
}

int run_convert(const std::filesystem::path& input_dir, const std::filesystem::path& output_dir) {
    std::filesystem::create_directories(output_dir);

    const auto sources = find_docx_files(input_dir);
    if (sources.empty()) {
        std::cerr << "No .docx files found in " << input_dir.string() << std::endl;
        return 1;
    }
    log::info("converting " + std::to_string(sources.size()) + " documents from " +
              input_dir.string());

    for (const auto& source : sources) {
        const auto paragraphs = read_docx_paragraphs(source.string());
        const auto destination = output_dir / plain_text_file_name(source);
        write_text_file(destination, render_plain_text(paragraphs));
        std::cout << "Wrote " << destination.string() << std::endl;
    }
    return 0;
}

}  // namespace
}  // namespace taktkb

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << taktkb::kUsage << std::endl;
        return 2;
    }

    try {
        taktkb::log::set_threshold(taktkb::Config::load().log_level());
        taktkb::log::info(std::string{"docx_to_text starting (version "} + taktkb::kVersion + ')');
        const auto input_dir = std::filesystem::absolute(argv[1]).lexically_normal();
        const auto output_dir = std::filesystem::absolute(argv[2]).lexically_normal();
        return taktkb::run_convert(input_dir, output_dir);
    } catch (const std::exception& ex) {
        taktkb::log::error(std::string{"fatal error: "} + ex.what());
        return 1;
    }
}
