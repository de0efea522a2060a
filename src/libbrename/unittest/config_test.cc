// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "../config.h"
#include "../exception.h"
#include <futil/fakefs/fakefs.h>
#include <tmock/tmock.h>

static void
expect_invalid(const char* text, const char* reason)
{
    make_file("/bad.txt",text);
    try
    {
        brename::load_configuration("/bad.txt");
        tmock::abort("Expected invalid_config_file_exception!");
    }
    catch (const brename::invalid_config_file_exception& e)
    {
        TASSERT(std::string(e.what()).find(reason) != std::string::npos);
    }
    futil::unlink("/bad.txt");
}

class tmock_test
{
    TMOCK_TEST(test_defaults)
    {
        make_file("/empty.txt");
        auto c = brename::load_configuration("/empty.txt");
        TASSERT(!c.require_file_or_symlink);
        TASSERT(c.create_parent_dirs);
        TASSERT(c.checkpoint);
        tmock::assert_equiv(c.max_depth,0UL);
        TASSERT(c.include_files);
        TASSERT(!c.include_dirs);
        TASSERT(c.include_symlinks);
        TASSERT(!c.debug);
    }

    TMOCK_TEST(test_to_string)
    {
        auto c = brename::default_configuration;
        c.max_depth = 3;
        c.include_dirs = true;
        const char* expected =
            "require_file_or_symlink false\n"
            "create_parent_dirs      true\n"
            "checkpoint              true\n"
            "max_depth               3\n"
            "include_files           true\n"
            "include_dirs            true\n"
            "include_symlinks        true\n"
            "debug                   false\n";
        tmock::assert_equiv(brename::to_string(c),expected);

        make_file("/config.txt",brename::to_string(c));
        auto c2 = brename::load_configuration("/config.txt");
        tmock::assert_equiv(c2.max_depth,3UL);
        TASSERT(c2.include_dirs);
        TASSERT(c2.checkpoint);
    }

    TMOCK_TEST(test_parse)
    {
        make_file("/config.txt",
                  "# brename settings\n"
                  "\n"
                  "require_file_or_symlink yes\n"
                  "  checkpoint 0  \n"
                  "max_depth 1K\n"
                  "include_symlinks no\n"
                  "debug 1");
        auto c = brename::load_configuration("/config.txt");
        TASSERT(c.require_file_or_symlink);
        TASSERT(!c.checkpoint);
        tmock::assert_equiv(c.max_depth,1024UL);
        TASSERT(!c.include_symlinks);
        TASSERT(c.debug);
        TASSERT(c.create_parent_dirs);
    }

    TMOCK_TEST(test_invalid)
    {
        expect_invalid("bogus true\n","line 1: unknown key \"bogus\"");
        expect_invalid("\ndebug\n","line 2: expected \"key value\"");
        expect_invalid("debug true false\n","expected \"key value\"");
        expect_invalid("debug maybe\n","line 1: invalid value");
        expect_invalid("max_depth -\n","invalid value");
    }

    TMOCK_TEST(test_missing)
    {
        try
        {
            brename::load_configuration("/nope.txt");
            tmock::abort("Expected io_exception!");
        }
        catch (const brename::io_exception& e)
        {
            tmock::assert_equiv(e.errnov,ENOENT);
        }
    }
};

TMOCK_MAIN();
