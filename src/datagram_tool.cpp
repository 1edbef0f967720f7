#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "Logging.hpp"
#include "ToolCommands.hpp"

int main(int argc, char *argv[])
{
    Logger::init_from_env();

    ToolOptions opts;
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!parse_args(args, opts, std::cerr))
    {
        print_usage(std::cerr, argv[0]);
        return EXIT_USAGE;
    }

    std::ifstream in_file;
    std::ofstream out_file;
    if (!opts.input.empty())
    {
        in_file.open(opts.input, std::ios::binary);
        if (!in_file)
        {
            std::cerr << "Cannot open input " << opts.input << "\n";
            return EXIT_USAGE;
        }
    }
    if (!opts.output.empty())
    {
        out_file.open(opts.output, std::ios::binary | std::ios::trunc);
        if (!out_file)
        {
            std::cerr << "Cannot open output " << opts.output << "\n";
            return EXIT_USAGE;
        }
    }
    std::istream &in = opts.input.empty() ? std::cin : in_file;
    std::ostream &out = opts.output.empty() ? std::cout : out_file;

    return run_session(opts, in, out);
}
