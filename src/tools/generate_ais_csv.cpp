#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include "AisDataGenerator.hpp"

namespace
{
    template <typename T>
    bool parse_arg(std::string_view text, T &out)
    {
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc{} && ptr == text.data() + text.size();
    }
}

// Usage: generate_ais_csv [output.csv] [rows] [hours] [seed]
int main(int argc, char *argv[])
{
    std::filesystem::path output = "synthetic_ais.csv";
    AisLake::GeneratorOptions options;

    if (argc > 1)
        output = argv[1];

    long long hours = options.span_s / 3600;
    if ((argc > 2 && !parse_arg(argv[2], options.rows)) ||
        (argc > 3 && (!parse_arg(argv[3], hours) || hours <= 0)) ||
        (argc > 4 && !parse_arg(argv[4], options.seed)))
    {
        std::cerr << "Usage: " << argv[0] << " [output.csv] [rows] [hours] [seed]\n";
        return 1;
    }
    options.span_s = hours * 3600;

    try
    {
        AisLake::AisDataGenerator::generate(output, options);
        std::cout << "\nIngest it with:\n  aislake_ingest --output-root ./lake " << output.string() << "\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
