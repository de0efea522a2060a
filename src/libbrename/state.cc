// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "state.h"
#include "exception.h"
#include <futil/xact.h>
#include <yaml-cpp/yaml.h>

static void
emit_list(YAML::Emitter& out, const std::vector<brename::mapping>& v)
{
    out << YAML::BeginSeq;
    for (auto& m : v)
    {
        out << YAML::BeginMap;
        out << YAML::Key << "src" << YAML::Value << m.src._path;
        out << YAML::Key << "dst" << YAML::Value << m.dst._path;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

std::string
brename::to_yaml(const persistable_state& s)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "renamed" << YAML::Value;
    emit_list(out,s.renamed);
    out << YAML::Key << "pending" << YAML::Value;
    emit_list(out,s.pending);
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

static std::string
parse_path(const YAML::Node& record, const char* key, const char* list)
{
    const YAML::Node n = record[key];
    if (!n)
    {
        throw brename::invalid_state_file_exception(
            str::printf("record in \"%s\" is missing \"%s\"",list,key));
    }
    if (!n.IsScalar() || n.Scalar().empty())
    {
        throw brename::invalid_state_file_exception(
            str::printf("record in \"%s\" has an invalid \"%s\"",list,key));
    }
    return n.Scalar();
}

static std::vector<brename::mapping>
parse_list(const YAML::Node& root, const char* list)
{
    const YAML::Node n = root[list];
    if (!n)
    {
        throw brename::invalid_state_file_exception(
            str::printf("missing \"%s\"",list));
    }
    if (!n.IsSequence())
    {
        throw brename::invalid_state_file_exception(
            str::printf("\"%s\" is not a list",list));
    }

    std::vector<brename::mapping> v;
    for (const auto& record : n)
    {
        if (!record.IsMap())
        {
            throw brename::invalid_state_file_exception(
                str::printf("record in \"%s\" is not a map",list));
        }
        for (const auto& kv : record)
        {
            auto k = kv.first.as<std::string>();
            if (k != "src" && k != "dst")
            {
                throw brename::invalid_state_file_exception(
                    str::printf("unknown field \"%s\" in \"%s\"",
                                k.c_str(),list));
            }
        }
        v.push_back(brename::mapping{parse_path(record,"src",list),
                                     parse_path(record,"dst",list)});
    }
    return v;
}

brename::persistable_state
brename::parse_state(const std::string& text)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(text);
    }
    catch (const YAML::Exception& e)
    {
        throw invalid_state_file_exception(e.what());
    }

    if (!root.IsMap())
        throw invalid_state_file_exception("top level is not a map");
    for (const auto& kv : root)
    {
        auto k = kv.first.as<std::string>();
        if (k != "renamed" && k != "pending")
        {
            throw invalid_state_file_exception(
                str::printf("unknown field \"%s\"",k.c_str()));
        }
    }

    const YAML::Node& croot = root;
    return persistable_state{parse_list(croot,"renamed"),
                             parse_list(croot,"pending")};
}

void
brename::save_state(const persistable_state& s, const futil::path& path) try
{
    auto text = to_yaml(s);
    auto dir_path = path.parent();
    futil::directory dir(dir_path.empty() ? futil::path(".") : dir_path);
    futil::xact_mktemp tmp_fd(dir,0644);
    tmp_fd.write_all(text.data(),text.size());
    tmp_fd.fsync();
    futil::rename(dir,tmp_fd.name,dir,path.name().c_str());
    tmp_fd.commit();
    dir.fsync();
}
catch (const futil::errno_exception& e)
{
    throw io_exception("save state",e.errnov,path);
}

brename::persistable_state
brename::load_state(const futil::path& path)
{
    std::string text;
    try
    {
        futil::file fd(path,O_RDONLY);
        text = fd.read_to_eof();
    }
    catch (const futil::errno_exception& e)
    {
        throw io_exception("load state",e.errnov,path);
    }
    return parse_state(text);
}
