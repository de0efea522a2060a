// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "../validate.h"
#include "../exception.h"
#include <futil/fakefs/fakefs.h>
#include <tmock/tmock.h>

static bool
mentions(const std::exception& e, const char* s)
{
    return std::string(e.what()).find(s) != std::string::npos;
}

class tmock_test
{
    TMOCK_TEST(test_valid_set)
    {
        auto v = brename::validate({
            {"/a","/b"},
            {"c/./d//","e"},
            {"/a","/b"},
            {"/f","/f"},
        });
        tmock::assert_equiv(v.size(),3UL);
        TASSERT(v[0] == (brename::mapping{"/a","/b"}));
        TASSERT(v[1] == (brename::mapping{"/c/d","/e"}));
        TASSERT(v[2] == (brename::mapping{"/f","/f"}));
    }

    TMOCK_TEST(test_one_to_many)
    {
        try
        {
            brename::validate({{"/a","/b"},{"/x","/y"},{"/a","/c"}});
            tmock::abort("Expected one_to_many_exception!");
        }
        catch (const brename::one_to_many_exception& e)
        {
            TASSERT(e.sc == brename::ONE_TO_MANY);
            tmock::assert_equiv(e.src._path,"/a");
            tmock::assert_equiv(e.dst1._path,"/b");
            tmock::assert_equiv(e.dst2._path,"/c");
            TASSERT(mentions(e,"\"/a\""));
            TASSERT(mentions(e,"\"/b\""));
            TASSERT(mentions(e,"\"/c\""));
        }
    }

    TMOCK_TEST(test_many_to_one)
    {
        try
        {
            brename::validate({{"/a","/c"},{"/b","/c"}});
            tmock::abort("Expected many_to_one_exception!");
        }
        catch (const brename::many_to_one_exception& e)
        {
            tmock::assert_equiv(e.src1._path,"/a");
            tmock::assert_equiv(e.src2._path,"/b");
            tmock::assert_equiv(e.dst._path,"/c");
            TASSERT(mentions(e,"\"/a\""));
            TASSERT(mentions(e,"\"/b\""));
            TASSERT(mentions(e,"\"/c\""));
        }
    }

    TMOCK_TEST(test_many_to_one_self_mapping)
    {
        try
        {
            brename::validate({{"/a","/a"},{"/b","/a"}});
            tmock::abort("Expected many_to_one_exception!");
        }
        catch (const brename::many_to_one_exception& e)
        {
            tmock::assert_equiv(e.src1._path,"/a");
            tmock::assert_equiv(e.src2._path,"/b");
            tmock::assert_equiv(e.dst._path,"/a");
        }
    }

    TMOCK_TEST(test_non_leaf_node)
    {
        try
        {
            brename::validate({{"/x/y/z","/q"},{"/p","/x/y"}});
            tmock::abort("Expected non_leaf_node_exception!");
        }
        catch (const brename::non_leaf_node_exception& e)
        {
            tmock::assert_equiv(e.ancestor._path,"/x/y");
            tmock::assert_equiv(e.descendant._path,"/x/y/z");
            TASSERT(mentions(e,"\"/x/y\""));
            TASSERT(mentions(e,"\"/x/y/z\""));
        }
    }

    TMOCK_TEST(test_non_leaf_node_self_mapping)
    {
        try
        {
            brename::validate({{"/d","/d"},{"/d/f","/g"}});
            tmock::abort("Expected non_leaf_node_exception!");
        }
        catch (const brename::non_leaf_node_exception& e)
        {
            tmock::assert_equiv(e.ancestor._path,"/d");
            tmock::assert_equiv(e.descendant._path,"/d/f");
        }
    }

    TMOCK_TEST(test_sibling_prefix_is_not_ancestor)
    {
        auto v = brename::validate({{"/a/b","/a/bc/x"},{"/a/b.txt","/a/b-"}});
        tmock::assert_equiv(v.size(),2UL);
    }

    TMOCK_TEST(test_empty_path)
    {
        try
        {
            brename::validate({{"/a","/b"},{"","/c"}});
            tmock::abort("Expected empty_path_exception!");
        }
        catch (const brename::empty_path_exception& e)
        {
            TASSERT(e.sc == brename::EMPTY_PATH);
        }

        try
        {
            brename::validate({{"/a",""}});
            tmock::abort("Expected empty_path_exception!");
        }
        catch (const brename::empty_path_exception&)
        {
        }
    }

    TMOCK_TEST(test_validation_touches_nothing)
    {
        make_file("/a","a");
        make_file("/b","b");
        snapshot_fs();
        try
        {
            brename::validate({{"/a","/c"},{"/b","/c"}});
            tmock::abort("Expected many_to_one_exception!");
        }
        catch (const brename::many_to_one_exception&)
        {
        }
        TASSERT(trees_equal(snapshots[0],fs_root));
    }
};

TMOCK_MAIN();
