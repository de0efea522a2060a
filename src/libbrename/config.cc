// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "config.h"
#include "exception.h"
#include <strutil/strutil.h>
#include <stdexcept>

const brename::configuration brename::default_configuration =
{
    .require_file_or_symlink    = false,
    .create_parent_dirs         = true,
    .checkpoint                 = true,
    .max_depth                  = 0,
    .include_files              = true,
    .include_dirs               = false,
    .include_symlinks           = true,
    .debug                      = false,
};

static const char*
bool_str(bool v)
{
    return v ? "true" : "false";
}

std::string
brename::to_string(const configuration& c)
{
    std::string s;
    s += "require_file_or_symlink ";
    s += std::string(bool_str(c.require_file_or_symlink)) + "\n";
    s += "create_parent_dirs      ";
    s += std::string(bool_str(c.create_parent_dirs)) + "\n";
    s += "checkpoint              ";
    s += std::string(bool_str(c.checkpoint)) + "\n";
    s += "max_depth               ";
    s += std::to_string(c.max_depth) + "\n";
    s += "include_files           ";
    s += std::string(bool_str(c.include_files)) + "\n";
    s += "include_dirs            ";
    s += std::string(bool_str(c.include_dirs)) + "\n";
    s += "include_symlinks        ";
    s += std::string(bool_str(c.include_symlinks)) + "\n";
    s += "debug                   ";
    s += std::string(bool_str(c.debug)) + "\n";
    return s;
}

static void
parse_line(brename::configuration& config, const std::string& text,
    size_t lineno) try
{
    std::vector<std::string> parts = str::split(text);
    if (parts.size() != 2)
    {
        throw brename::invalid_config_file_exception(
            str::printf("line %zu: expected \"key value\"",lineno));
    }

    auto& k = parts[0];
    auto& v = parts[1];
    if (k == "require_file_or_symlink")
        config.require_file_or_symlink = str::decode_bool(v);
    else if (k == "create_parent_dirs")
        config.create_parent_dirs = str::decode_bool(v);
    else if (k == "checkpoint")
        config.checkpoint = str::decode_bool(v);
    else if (k == "max_depth")
        config.max_depth = str::decode_number_units_pow2(v);
    else if (k == "include_files")
        config.include_files = str::decode_bool(v);
    else if (k == "include_dirs")
        config.include_dirs = str::decode_bool(v);
    else if (k == "include_symlinks")
        config.include_symlinks = str::decode_bool(v);
    else if (k == "debug")
        config.debug = str::decode_bool(v);
    else
    {
        throw brename::invalid_config_file_exception(
            str::printf("line %zu: unknown key \"%s\"",lineno,k.c_str()));
    }
}
catch (const std::invalid_argument&)
{
    throw brename::invalid_config_file_exception(
        str::printf("line %zu: invalid value",lineno));
}
catch (const std::out_of_range&)
{
    throw brename::invalid_config_file_exception(
        str::printf("line %zu: value out of range",lineno));
}

brename::configuration
brename::load_configuration(const futil::path& path) try
{
    futil::file config_fd(path,O_RDONLY);
    configuration config = default_configuration;

    size_t lineno = 0;
    futil::file::line line;
    do
    {
        line = config_fd.read_line();
        ++lineno;
        auto text = str::strip(line.text);
        if (text.empty())
            continue;
        if (text[0] == '#')
            continue;

        parse_line(config,text,lineno);
    } while (line);

    return config;
}
catch (const futil::errno_exception& e)
{
    throw brename::io_exception("open",e.errnov,path);
}
