#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

#include <cpptrace/cpptrace.hpp>
#include <cpptrace/from_current.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/std.h>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sink.h>
#include <lyra/lyra.hpp>

#include "ProperNameTokenizer.hpp"
#include "dictionary_loader.hpp"

using namespace std::literals;

template<> struct fmt::formatter<lyra::cli> : ostream_formatter {};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if(!file) {
        throw std::runtime_error(fmt::format("Unable to open {}", path));
    }
    std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if(file.bad()) {
        throw std::runtime_error(fmt::format("Error while reading {}", path));
    }
    return contents;
}

void print_tokens(const Document& document) {
    for(std::size_t i = 0; const auto& sentence : document.sentences()) {
        fmt::print("sentence {}:\n", i++);
        for(const auto& token : sentence) {
            fmt::print("    {}\n", token);
        }
    }
}

int main(int argc, char** argv) CPPTRACE_TRY {
    std::string log_level = "info";
    std::string locale{default_locale};
    std::string input_path;
    std::string dictionary_path;
    bool show_tokens = false;
    bool show_help = false;
    auto cli = lyra::cli()
        | lyra::help(show_help)
        | lyra::arg(input_path, "input")("Text file to tokenize").required()
        | lyra::arg(dictionary_path, "dictionary")("Proper name dictionary, one name per line")
        | lyra::opt(log_level, "log level")["--log-level"]("Spdlog log level")
            .choices("trace", "debug", "info", "warn", "err", "critical", "off")
        | lyra::opt(locale, "locale")["--locale"]("Locale used for sentence and word boundaries")
        | lyra::opt(show_tokens)["--tokens"]("Print every sentence and token instead of the proper names");
    if(auto result = cli.parse({ argc, argv }); !result) {
        fmt::print(stderr, "Error in command line: {}\n", result.message());
        return 1;
    }
    if(show_help) {
        fmt::print("{}\n", cli);
        return 0;
    }
    spdlog::set_default_logger(spdlog::stderr_color_mt("pntok"));
    spdlog::set_level(spdlog::level::from_str(log_level));

    std::optional<ProperNameTokenizer> tokenizer;
    if(dictionary_path.empty()) {
        tokenizer.emplace(default_dictionary(), locale);
    } else {
        spdlog::info("Loading dictionary {}", dictionary_path);
        tokenizer.emplace(load_dictionary(std::filesystem::path(dictionary_path)), locale);
    }

    spdlog::info("Tokenizing {}", input_path);
    auto document = tokenizer->parse_document(read_file(input_path));

    if(show_tokens) {
        print_tokens(document);
    } else {
        for(const auto& name : all_proper_names(document)) {
            fmt::print("{}\n", name);
        }
    }
} CPPTRACE_CATCH(const std::exception& e) {
    fmt::print(stderr, "Caught exception {}: {}\n", cpptrace::demangle(typeid(e).name()), e.what());
    cpptrace::from_current_exception().print();
    return 1;
}
