/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <algorithm>
#include <cerrno>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/program_options.hpp>

#include <nvmecore/trace.hh>

#include "drivers/nvme-debug.hh"
#include "drivers/nvme-options.hh"

namespace bpo = boost::program_options;

namespace nvme {

int parse_options(const std::vector<std::string>& args, driver_options& opts)
{
    std::string log_level;

    bpo::options_description desc("nvme driver options");
    desc.add_options()
        ("nvme.io_queue_depth", bpo::value<unsigned>(&opts.io_queue_depth),
            "entries per I/O submission/completion queue")
        ("nvme.io_queues", bpo::value<unsigned>(&opts.io_queues),
            "number of interrupt driven I/O queues")
        ("nvme.poll_queues", bpo::value<unsigned>(&opts.poll_queues),
            "number of polled I/O queues")
        ("nvme.shadow_doorbells", bpo::value<bool>(&opts.shadow_doorbells),
            "use shadow doorbell buffers when the controller supports them")
        ("nvme.sq_db_coalesce", bpo::value<unsigned>(&opts.sq_db_coalesce),
            "deferred submissions before the doorbell is rung, 0 for queue depth - 1")
        ("nvme.log_level", bpo::value<std::string>(&log_level),
            "debug, info, warn, error or none")
        ("nvme.trace", bpo::value<std::vector<std::string>>(&opts.trace)->composing(),
            "enable tracepoints matching the glob")
        ;

    try {
        bpo::variables_map vars;
        auto parsed = bpo::command_line_parser(args)
            .options(desc)
            .style(bpo::command_line_style::unix_style &
                   ~bpo::command_line_style::allow_guessing)
            .allow_unregistered()
            .run();
        bpo::store(parsed, vars);
        bpo::notify(vars);
    } catch (bpo::error& e) {
        nvme_e("invalid option: %s", e.what());
        return EINVAL;
    }

    if (!log_level.empty() && !nvmecore::parse_log_level(log_level, opts.log_level)) {
        nvme_e("invalid log level: %s", log_level.c_str());
        return EINVAL;
    }

    opts.io_queue_depth = clamp_queue_depth(opts.io_queue_depth);
    return 0;
}

int parse_options(const std::string& cmdline, driver_options& opts)
{
    std::vector<std::string> args;
    boost::split(args, cmdline, boost::is_any_of(" \t\n"), boost::token_compress_on);
    args.erase(std::remove(args.begin(), args.end(), std::string()), args.end());
    return parse_options(args, opts);
}

void apply_options(const driver_options& opts)
{
    nvmecore::set_log_level(opts.log_level);
    for (auto& pattern : opts.trace) {
        if (!nvmecore::enable_tracepoints(pattern)) {
            nvme_i("no tracepoint matches %s", pattern.c_str());
        }
    }
}

unsigned clamp_queue_depth(unsigned depth)
{
    return std::min(std::max(depth, unsigned(NVME_MIN_QUEUE_SIZE)), unsigned(NVME_MAX_QUEUE_SIZE));
}

unsigned sq_db_coalesce_limit(const driver_options& opts, unsigned depth)
{
    if (opts.sq_db_coalesce == 0 || opts.sq_db_coalesce > depth - 1) {
        return depth - 1;
    }
    return opts.sq_db_coalesce;
}

}
