// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include <version.h>
#include <strutil/strutil.h>
#include <libbrename/brename.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define DEFAULT_STATE_PATH  ".brename-state.yaml"

static void usage() __NORETURN__;

static brename::configuration config = brename::default_configuration;
static futil::path state_path(DEFAULT_STATE_PATH);

static std::vector<brename::mapping>
load_pairs(const futil::path& path)
{
    // One mapping per line, "src<TAB>dst".  Blank lines and lines starting
    // with '#' are ignored.
    std::vector<brename::mapping> pairs;
    futil::file pairs_fd(path,O_RDONLY);
    size_t lineno = 0;
    futil::file::line line;
    do
    {
        line = pairs_fd.read_line();
        ++lineno;
        if (str::strip(line.text).empty())
            continue;
        if (line.text[0] == '#')
            continue;

        auto parts = str::split(line.text,"\t");
        if (parts.size() != 2 || parts[0].empty() || parts[1].empty())
        {
            fprintf(stderr,"%s:%zu: expected \"src<TAB>dst\".\n",
                    path.c_str(),lineno);
            exit(1);
        }
        pairs.push_back(brename::mapping{parts[0],parts[1]});
    } while (line);

    return pairs;
}

static void
print_mappings(const char* title, std::span<const brename::mapping> v)
{
    printf("%s (%zu):\n",title,v.size());
    for (const auto& m : v)
        printf("    %s\n",to_string(m).c_str());
}

static void
handle_plan(const std::vector<std::string>& args)
{
    auto q = brename::rename_queue::plan(load_pairs(args[0]),config);
    for (const auto& m : q.queue)
        printf("%s\n",to_string(m).c_str());
}

static void
handle_apply(const std::vector<std::string>& args)
{
    if (futil::exists(state_path))
    {
        fprintf(stderr,"State file %s already exists; resume or revert "
                "it first.\n",state_path.c_str());
        exit(1);
    }

    auto q = brename::rename_queue::plan(load_pairs(args[0]),config);
    brename::run_atomic(q,&brename::rename_queue::apply_atomic,
                        state_path);
    printf("Applied %zu renames.\n",q.size());
}

static void
handle_resume(const std::vector<std::string>&)
{
    brename::rename_queue q(brename::load_state(state_path),config);
    size_t n = q.pending().size();
    brename::run_atomic(q,&brename::rename_queue::apply_atomic,
                        state_path);
    printf("Applied %zu pending renames.\n",n);
}

static void
handle_revert(const std::vector<std::string>&)
{
    brename::rename_queue q(brename::load_state(state_path),config);
    size_t n = q.renamed().size();
    brename::run_atomic(q,&brename::rename_queue::revert_atomic,
                        state_path);
    printf("Reverted %zu renames.\n",n);
}

static void
handle_status(const std::vector<std::string>&)
{
    brename::rename_queue q(brename::load_state(state_path),config);
    print_mappings("renamed",q.renamed());
    print_mappings("pending",q.pending());
}

static void
handle_list(const std::vector<std::string>& args)
{
    brename::walk_dir w(args[0],brename::walk_options::from_config(config));
    brename::walk_entry e;
    while (w.next(e))
    {
        char type = e.is_dir() ? 'd' : e.is_symlink() ? 'l' : 'f';
        printf("%c %s\n",type,e.path.c_str());
    }
}

struct command_syntax
{
    const char* name;
    size_t      nargs;
    void (* const handler)(const std::vector<std::string>& args);
};

static const command_syntax commands[] =
{
    {"plan",    1,  handle_plan},
    {"apply",   1,  handle_apply},
    {"resume",  0,  handle_resume},
    {"revert",  0,  handle_revert},
    {"status",  0,  handle_status},
    {"list",    1,  handle_list},
};

static void
usage()
{
    fprintf(stderr,
        "brename %s\n"
        "Usage: brename [-d] [-c config] [-s state] <command> [args]\n"
        "\n"
        "    plan   <pairs-file>    print the resolved rename order\n"
        "    apply  <pairs-file>    resolve and apply atomically\n"
        "    resume                 apply the pending renames in the state\n"
        "    revert                 revert the applied renames in the state\n"
        "    status                 print the state\n"
        "    list   <directory>     list candidate paths\n"
        "\n"
        "The pairs file holds one \"src<TAB>dst\" mapping per line.  The\n"
        "state file defaults to " DEFAULT_STATE_PATH ".\n",
        GIT_VERSION);
    exit(1);
}

int
main(int argc, const char* argv[])
{
    int i = 1;
    bool debug = false;
    const char* config_path = NULL;
    for (; i < argc && argv[i][0] == '-'; ++i)
    {
        if (!strcmp(argv[i],"-d"))
            debug = true;
        else if (!strcmp(argv[i],"-c") && i + 1 < argc)
            config_path = argv[++i];
        else if (!strcmp(argv[i],"-s") && i + 1 < argc)
            state_path = futil::path(argv[++i]);
        else
            usage();
    }
    if (i == argc)
        usage();

    const char* name = argv[i++];
    std::vector<std::string> args(argv + i,argv + argc);
    for (const auto& c : commands)
    {
        if (strcmp(c.name,name))
            continue;
        if (args.size() != c.nargs)
            usage();

        try
        {
            if (config_path)
                config = brename::load_configuration(config_path);
            config.debug = config.debug || debug;
            c.handler(args);
        }
        catch (const std::exception& e)
        {
            fprintf(stderr,"Error: %s\n",e.what());
            return 1;
        }
        return 0;
    }

    usage();
}
