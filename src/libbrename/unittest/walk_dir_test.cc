// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "../walk_dir.h"
#include "../exception.h"
#include <futil/fakefs/fakefs.h>
#include <tmock/tmock.h>

static void
make_tree()
{
    make_file("/r/f1","1");
    make_symlink("/r/l1","f1");
    make_file("/r/sub/f2","22");
    make_file("/r/sub/deeper/f3","333");
}

static std::vector<std::string>
walk(const brename::walk_options& options)
{
    std::vector<std::string> v;
    brename::walk_dir w("/r",options);
    brename::walk_entry e;
    while (w.next(e))
        v.push_back(e.path._path);
    return v;
}

static void
assert_paths(const std::vector<std::string>& v,
    const std::vector<std::string>& expected)
{
    tmock::assert_equiv(v.size(),expected.size());
    for (size_t i=0; i<v.size(); ++i)
        tmock::assert_equiv(v[i],expected[i]);
}

class tmock_test
{
    TMOCK_TEST(test_defaults)
    {
        make_tree();
        auto options =
            brename::walk_options::from_config(brename::default_configuration);
        assert_paths(walk(options),{
            "/r/f1",
            "/r/l1",
            "/r/sub/deeper/f3",
            "/r/sub/f2",
        });
    }

    TMOCK_TEST(test_top_level_only)
    {
        make_tree();
        brename::walk_options options{1,true,true,true,false};
        assert_paths(walk(options),{"/r/f1","/r/l1","/r/sub"});
    }

    TMOCK_TEST(test_depth_two_with_dirs)
    {
        make_tree();
        brename::walk_options options{2,true,true,true,false};
        assert_paths(walk(options),{
            "/r/f1",
            "/r/l1",
            "/r/sub",
            "/r/sub/deeper",
            "/r/sub/f2",
        });
    }

    TMOCK_TEST(test_filters)
    {
        make_tree();
        assert_paths(walk(brename::walk_options{0,false,true,false,false}),
                     {"/r/sub","/r/sub/deeper"});
        assert_paths(walk(brename::walk_options{0,false,false,true,false}),
                     {"/r/l1"});
        assert_paths(walk(brename::walk_options{0,false,false,false,false}),
                     {});
    }

    TMOCK_TEST(test_entry_metadata)
    {
        make_tree();
        brename::walk_dir w("/r",brename::walk_options{1,true,true,true,false});
        brename::walk_entry e;

        TASSERT(w.next(e));
        tmock::assert_equiv(e.path._path,"/r/f1");
        tmock::assert_equiv(e.depth,1UL);
        TASSERT(e.is_file());
        tmock::assert_equiv(e.st.st_size,(off_t)1);

        TASSERT(w.next(e));
        TASSERT(e.is_symlink());
        TASSERT(!e.is_file());

        TASSERT(w.next(e));
        TASSERT(e.is_dir());

        TASSERT(!w.next(e));
        TASSERT(!w.next(e));
    }

    TMOCK_TEST(test_symlinks_not_followed)
    {
        make_tree();
        make_symlink("/r/loop","/r");
        brename::walk_options options{0,true,false,true,false};
        assert_paths(walk(options),{
            "/r/f1",
            "/r/l1",
            "/r/loop",
            "/r/sub/deeper/f3",
            "/r/sub/f2",
        });
    }

    TMOCK_TEST(test_bad_root)
    {
        make_file("/file");
        try
        {
            brename::walk_dir w("/missing",brename::walk_options{});
            tmock::abort("Expected io_exception!");
        }
        catch (const brename::io_exception& e)
        {
            tmock::assert_equiv(e.errnov,ENOENT);
            tmock::assert_equiv(e.path1._path,"/missing");
        }

        try
        {
            brename::walk_dir w("/file",brename::walk_options{});
            tmock::abort("Expected io_exception!");
        }
        catch (const brename::io_exception& e)
        {
            tmock::assert_equiv(e.errnov,ENOTDIR);
        }
    }
};

TMOCK_MAIN();
