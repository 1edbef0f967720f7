#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "ChunkerConfig.hpp"

class ChunkMetrics;

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_CHUNKER = 2;

struct ToolOptions
{
    std::string command;
    std::string input;
    std::string output;
    std::string config_path;
    std::optional<std::size_t> max_size;
    bool stats = false;
};

void print_usage(std::ostream &err, const std::string &prog);

// args excludes the program name. Problems are reported on err.
bool parse_args(const std::vector<std::string> &args, ToolOptions &opts, std::ostream &err);

// Default < --config file < environment < --max-size. Throws ChunkerError.
ChunkerConfig resolve_config(const ToolOptions &opts);

// One message per input line in, 4-byte length-prefixed datagram records out.
// Throws std::runtime_error when out fails.
std::size_t run_pack(const ChunkerConfig &config, std::istream &in, std::ostream &out, ChunkMetrics &metrics);

// Datagram records in, one message per line out.
std::size_t run_unpack(const ChunkerConfig &config, std::istream &in, std::ostream &out, ChunkMetrics &metrics);

// Runs opts.command over the given streams and returns the process exit code.
int run_session(const ToolOptions &opts, std::istream &in, std::ostream &out);
