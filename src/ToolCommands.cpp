#include "ToolCommands.hpp"

#include <cstdlib>
#include <istream>
#include <ostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "ChunkerError.hpp"
#include "DatagramChunker.hpp"
#include "DatagramDechunker.hpp"
#include "Framing.hpp"
#include "Logging.hpp"
#include "Metrics.hpp"
#include "utils.hpp"

namespace
{
    constexpr std::size_t READ_BUFFER_SIZE = 4096;
    // Records larger than any legal datagram still reach the dechunker's size check.
    constexpr std::size_t MAX_RECORD_SIZE = 1 << 20;

    void check_output(const std::ostream &out)
    {
        if (!out)
            throw std::runtime_error("cannot write output");
    }
}

void print_usage(std::ostream &err, const std::string &prog)
{
    err << "Usage:\n"
        << "  " << prog << " pack   [--max-size N] [--config FILE] [--stats] [-i IN] [-o OUT]\n"
        << "  " << prog << " unpack [--max-size N] [--config FILE] [--stats] [-i IN] [-o OUT]\n"
        << "pack reads one message per line and writes length-prefixed datagram records;\n"
        << "unpack reverses it. Messages cannot contain '\\n', and a trailing '\\r' is\n"
        << "dropped from each line as part of a CRLF ending.\n"
        << "Size precedence: --max-size, " << ChunkerConfig::ENV_MAX_SIZE
        << ", --config, default " << ChunkerConfig::DEFAULT_MAX_DATAGRAM_SIZE << ".\n";
}

bool parse_args(const std::vector<std::string> &args, ToolOptions &opts, std::ostream &err)
{
    if (args.empty())
        return false;
    opts.command = args[0];
    if (opts.command != "pack" && opts.command != "unpack")
    {
        err << "Unknown command: " << opts.command << "\n";
        return false;
    }

    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--stats")
        {
            opts.stats = true;
            continue;
        }
        if (arg != "--max-size" && arg != "-i" && arg != "-o" && arg != "--config")
        {
            err << "Unknown argument: " << arg << "\n";
            return false;
        }
        if (i + 1 >= args.size())
        {
            err << "Missing value for " << arg << "\n";
            return false;
        }

        const std::string &v = args[++i];
        if (arg == "--max-size")
        {
            opts.max_size = parseSize(v);
            if (!opts.max_size)
            {
                err << "Invalid --max-size: " << v << "\n";
                return false;
            }
        }
        else if (arg == "-i")
            opts.input = v;
        else if (arg == "-o")
            opts.output = v;
        else
            opts.config_path = v;
    }
    return true;
}

ChunkerConfig resolve_config(const ToolOptions &opts)
{
    ChunkerConfig config;
    if (!opts.config_path.empty() && !config.loadFromFile(opts.config_path))
    {
        throw ChunkerError(ChunkErrorKind::InvalidConfiguration, "cannot open config file " + opts.config_path);
    }
    config.apply_env();
    if (opts.max_size)
        return ChunkerConfig::with_max_size(*opts.max_size);
    config.validate();
    return config;
}

std::size_t run_pack(const ChunkerConfig &config, std::istream &in, std::ostream &out, ChunkMetrics &metrics)
{
    MessageSource source = [&in]() -> std::optional<std::string>
    {
        std::string line;
        if (!std::getline(in, line))
            return std::nullopt;
        trimCarriageReturn(line);
        return line;
    };
    DatagramSink sink = [&out](std::string datagram)
    {
        std::string record = frame_record(datagram);
        out.write(record.data(), static_cast<std::streamsize>(record.size()));
        check_output(out);
    };
    return chunk_messages(config, source, sink, &metrics);
}

std::size_t run_unpack(const ChunkerConfig &config, std::istream &in, std::ostream &out, ChunkMetrics &metrics)
{
    RecordReader records(MAX_RECORD_SIZE);
    DatagramSource source = [&in, &records]() -> std::optional<std::string>
    {
        while (true)
        {
            if (auto record = records.pop())
                return record;
            char buffer[READ_BUFFER_SIZE];
            in.read(buffer, sizeof(buffer));
            std::streamsize got = in.gcount();
            if (got <= 0)
            {
                if (records.pending() != 0)
                    throw std::runtime_error("input ends inside a datagram record");
                return std::nullopt;
            }
            records.append(buffer, static_cast<std::size_t>(got));
        }
    };
    MessageSink sink = [&out](std::string message)
    {
        out << message << '\n';
        check_output(out);
    };
    return dechunk_datagrams(config, source, sink, &metrics);
}

int run_session(const ToolOptions &opts, std::istream &in, std::ostream &out)
{
    ChunkMetrics metrics;
    ChunkerConfig config;
    int rc = EXIT_SUCCESS;
    try
    {
        config = resolve_config(opts);
        Logger::log_event(LogLevel::Info, "session_start", "Starting " + opts.command, config.to_json());
        if (opts.command == "pack")
            run_pack(config, in, out, metrics);
        else
            run_unpack(config, in, out, metrics);
    }
    catch (const ChunkerError &e)
    {
        Logger::log_event(LogLevel::Error, "session_failed", e.what(), e.to_json());
        rc = EXIT_CHUNKER;
    }
    catch (const std::exception &e)
    {
        Logger::log_event(LogLevel::Error, "session_failed", e.what(), {{"error", "ERR_IO"}});
        rc = EXIT_CHUNKER;
    }

    out.flush();
    if (!out && rc == EXIT_SUCCESS)
    {
        Logger::log_event(LogLevel::Error, "session_failed", "cannot write output", {{"error", "ERR_IO"}});
        rc = EXIT_CHUNKER;
    }

    nlohmann::json extra = {{"messages", metrics.messages()}, {"datagrams", metrics.datagrams()}};
    if (opts.stats)
        extra = metrics.snapshot(config.max_datagram_size);
    Logger::log_event(rc == EXIT_SUCCESS ? LogLevel::Info : LogLevel::Warn, "session_finish", "Finished " + opts.command, extra);
    return rc;
}
