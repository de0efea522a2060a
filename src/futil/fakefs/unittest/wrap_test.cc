// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "../fakefs.h"
#include <futil/futil.h>
#include <futil/xact.h>
#include <tmock/tmock.h>

class tmock_test
{
    TMOCK_TEST(test_creat_excl)
    {
        auto cwd = futil::directory(AT_FDCWD,"./");
        auto fd0 = futil::file(cwd,"fd0",O_CREAT | O_EXCL,0777);
        try
        {
            futil::file(cwd,"fd0",O_CREAT | O_EXCL,0777);
            tmock::abort("Expected exception trying to create exclusive file "
                         "that already exists!");
        }
        catch (const futil::errno_exception& e)
        {
            TASSERT(e.errnov == EEXIST);
        }
    }

    TMOCK_TEST(test_paths)
    {
        auto cwd0 = futil::directory(AT_FDCWD,".");
        auto cwd1 = futil::directory(AT_FDCWD,"./");
        auto cwd2 = futil::directory(AT_FDCWD,"/");
        TASSERT(fd_table[cwd0.fd].directory == fs_root);
        TASSERT(fd_table[cwd1.fd].directory == fs_root);
        TASSERT(fd_table[cwd2.fd].directory == fs_root);

        futil::mkdir(cwd0,"dir1",0777);
        auto cwd3 = futil::directory(AT_FDCWD,"./dir1");
        auto cwd4 = futil::directory(AT_FDCWD,"/dir1/./");
        auto cwd5 = futil::directory(AT_FDCWD,"././dir1/../../../dir1");
        TASSERT(fd_table[cwd3.fd].directory == fs_root->subdirs["dir1"]);
        TASSERT(fd_table[cwd4.fd].directory == fs_root->subdirs["dir1"]);
        TASSERT(fd_table[cwd5.fd].directory == fs_root->subdirs["dir1"]);

        auto cwd6 = futil::directory(AT_FDCWD,"dir1/..");
        TASSERT(fd_table[cwd6.fd].directory == fs_root);
    }

    TMOCK_TEST(test_getcwd)
    {
        tmock::assert_equiv(futil::getcwd(),"/");
        tmock::assert_equiv(futil::path("a/b").absolute()._path,"/a/b");
    }

    TMOCK_TEST(test_unlink)
    {
        auto cwd = futil::directory(AT_FDCWD,"./");
        futil::mkdir(cwd,"dir1",0777);
        futil::file(cwd,"fd0",O_CREAT | O_EXCL,0777);
        futil::file(cwd,"dir1/fd1",O_CREAT | O_EXCL,0777);

        try
        {
            futil::unlink(cwd,"dir1");
            tmock::abort("Expected exception trying to unlink a directory "
                         "without specifying AT_REMOVEDIR.");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,EISDIR);
        }

        try
        {
            futil::unlinkat(AT_FDCWD,"dir1",AT_REMOVEDIR);
            tmock::abort("Expected exception removing a non-empty "
                         "directory.");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,ENOTEMPTY);
        }

        futil::unlink(cwd,"dir1/fd1");
        futil::unlinkat(AT_FDCWD,"dir1",AT_REMOVEDIR);
        futil::unlink(cwd,"fd0");
        TASSERT(fs_root->files.empty());
        TASSERT(fs_root->subdirs.empty());
        tmock::assert_equiv(live_files.size(),0UL);
        tmock::assert_equiv(live_dirs.size(),1UL);

        futil::unlink_if_exists("fd0");
    }

    TMOCK_TEST(test_mkdirat_if_not_exists)
    {
        tmock::assert_equiv(
            futil::mkdirat_if_not_exists(AT_FDCWD,"test_dir",0777),
            true);
        tmock::assert_equiv(
            futil::mkdirat_if_not_exists(AT_FDCWD,"test_dir/sub",0777),
            true);
        tmock::assert_equiv(
            futil::mkdirat_if_not_exists(AT_FDCWD,"test_dir",0777),
            false);
        TASSERT(fs_root->subdirs["test_dir"]->subdirs.contains("sub"));

        make_file("test_file");
        tmock::assert_equiv(
            futil::mkdirat_if_not_exists(AT_FDCWD,"test_file",0777),
            false);
    }

    TMOCK_TEST(test_readdir)
    {
        make_dirs("/d/0003");
        make_file("/d/0002");
        make_symlink("/d/0001","0002");

        int at_fd = futil::openat(AT_FDCWD,"/d",O_DIRECTORY);
        auto* dirp = futil::fdopendir(at_fd);

        auto* dp = futil::readdir(dirp);
        TASSERT(dp != NULL);
        tmock::assert_equiv(dp->d_name,"0001");
        tmock::assert_equiv(dp->d_type,DT_LNK);
        dp = futil::readdir(dirp);
        TASSERT(dp != NULL);
        tmock::assert_equiv(dp->d_name,"0002");
        tmock::assert_equiv(dp->d_type,DT_REG);
        dp = futil::readdir(dirp);
        tmock::assert_equiv(dp->d_name,".");
        dp = futil::readdir(dirp);
        tmock::assert_equiv(dp->d_name,"..");
        dp = futil::readdir(dirp);
        TASSERT(dp != NULL);
        tmock::assert_equiv(dp->d_name,"0003");
        tmock::assert_equiv(dp->d_type,DT_DIR);
        TASSERT(futil::readdir(dirp) == NULL);

        futil::closedir(dirp);
    }

    TMOCK_TEST(test_symlink_fstatat)
    {
        make_file("/dir/target","hello");
        make_symlink("/dir/link","target");
        make_symlink("/dangling","/nowhere");

        struct stat st;
        futil::fstatat(AT_FDCWD,"/dir/link",&st,AT_SYMLINK_NOFOLLOW);
        TASSERT(S_ISLNK(st.st_mode));
        futil::fstatat(AT_FDCWD,"/dir/link",&st,0);
        TASSERT(S_ISREG(st.st_mode));
        tmock::assert_equiv(st.st_size,(off_t)5);
        futil::fstatat(AT_FDCWD,"/dir",&st,0);
        TASSERT(S_ISDIR(st.st_mode));

        TASSERT(futil::exists("/dangling"));
        TASSERT(!futil::fstatat_if_exists(AT_FDCWD,"/dangling",&st,0));
        TASSERT(!futil::exists("/dir/target/sub"));
        TASSERT(!futil::exists("/missing"));
        TASSERT(S_ISLNK(futil::lstat("/dangling").st_mode));

        try
        {
            futil::symlink("x","/dir/target");
            tmock::abort("Expected EEXIST creating a symlink over a file!");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,EEXIST);
        }
    }

    TMOCK_TEST(test_symlink_loop)
    {
        make_symlink("/a","b");
        make_symlink("/b","a");

        struct stat st;
        try
        {
            futil::fstatat(AT_FDCWD,"/a",&st,0);
            tmock::abort("Expected ELOOP!");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,ELOOP);
        }
    }

    TMOCK_TEST(test_rename_symlink)
    {
        auto* fn = make_symlink("/x/link","/target");
        futil::rename("/x/link","/y");
        TASSERT(find_file("/x/link") == NULL);
        TASSERT(find_file("/y") == fn);
        TASSERT(fn->symlink);
        tmock::assert_equiv(fn->data_as_string(),"/target");
    }

    TMOCK_TEST(test_renameat_file)
    {
        futil::mkdirat(AT_FDCWD,"dir1",0777);
        futil::mkdirat(AT_FDCWD,"dir3",0777);
        auto* fn = make_file("dir1/fd","1234567890");
        auto* fn2 = make_file("dir3/fd2","abc");

        try
        {
            futil::rename("dir1/blah","dir3");
            tmock::abort("Expected exception renaming nonexistent file!");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,ENOENT);
        }

        try
        {
            futil::rename("dir1/fd","dir3");
            tmock::abort("Expected exception renaming file over directory!");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,EISDIR);
        }

        futil::rename("dir1/fd","dir3/fd2");
        TASSERT(!live_files.contains(fn2));
        TASSERT(fs_root->subdirs["dir3"]->files["fd2"] == fn);
        TASSERT(fs_root->subdirs["dir1"]->files.empty());
    }

    TMOCK_TEST(test_renameat_dir)
    {
        make_file("/a/b/c/f");
        make_dirs("/x");

        try
        {
            futil::rename("/a","/a/b/c/d");
            tmock::abort("Expected EINVAL moving a directory inside itself!");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,EINVAL);
        }

        try
        {
            futil::rename("/x","/a");
            tmock::abort("Expected ENOTEMPTY moving over a full directory!");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,ENOTEMPTY);
        }

        futil::rename("/a/b","/x/moved");
        TASSERT(find_file("/x/moved/c/f") != NULL);
        TASSERT(find_dir("/a/b") == NULL);
        TASSERT(find_dir("/x/moved")->parent == find_dir("/x"));
    }

    TMOCK_TEST(test_rename_faults)
    {
        make_file("/a");
        rename_faults["/a"] = EIO;
        try
        {
            futil::rename("/a","/b");
            tmock::abort("Expected injected EIO!");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,EIO);
        }
        TASSERT(find_file("/a") != NULL);
        TASSERT(find_file("/b") == NULL);

        rename_faults.clear();
        futil::rename("/a","/b");
        TASSERT(find_file("/b") != NULL);
    }

    TMOCK_TEST(test_rename_if_not_exists)
    {
        make_file("/a","A");
        make_file("/b","B");
        make_dirs("/d");

        TASSERT(!futil::rename_if_not_exists("/a","/b"));
        TASSERT(!futil::rename_if_not_exists("/a","/d"));
        tmock::assert_equiv(find_file("/b")->data_as_string(),"B");

        TASSERT(futil::rename_if_not_exists("/a","/c"));
        TASSERT(find_file("/a") == NULL);
        tmock::assert_equiv(find_file("/c")->data_as_string(),"A");
    }

    TMOCK_TEST(test_stat_races)
    {
        stat_races["/x"] = "late";
        TASSERT(!futil::exists("/x"));
        tmock::assert_equiv(find_file("/x")->data_as_string(),"late");
        TASSERT(stat_races.empty());
        TASSERT(futil::exists("/x"));
    }

    TMOCK_TEST(test_xact_mkdir_all_commit)
    {
        make_dirs("/a");
        {
            futil::xact_mkdir_all mx("/a/b/c",0755);
            tmock::assert_equiv(mx.created.size(),2UL);
            tmock::assert_equiv(mx.created[0]._path,"/a/b");
            tmock::assert_equiv(mx.created[1]._path,"/a/b/c");
            mx.commit();
        }
        TASSERT(find_dir("/a/b/c") != NULL);
    }

    TMOCK_TEST(test_xact_mkdir_all_rollback)
    {
        make_file("/a/keep");
        {
            futil::xact_mkdir_all mx("/a/b/c/d",0755);
            TASSERT(find_dir("/a/b/c/d") != NULL);
        }
        TASSERT(find_dir("/a") != NULL);
        TASSERT(find_dir("/a/b") == NULL);
        TASSERT(find_file("/a/keep") != NULL);
    }

    TMOCK_TEST(test_xact_mkdir_all_enotdir)
    {
        make_file("/a/f");
        try
        {
            futil::xact_mkdir_all mx("/a/new/../f/g",0755);
            tmock::abort("Expected ENOTDIR!");
        }
        catch (const futil::errno_exception& e)
        {
            tmock::assert_equiv(e.errnov,ENOTDIR);
        }
        TASSERT(find_dir("/a/new") == NULL);
        tmock::assert_equiv(find_dir("/a")->subdirs.size(),0UL);
    }

    TMOCK_TEST(test_xact_mktemp)
    {
        futil::directory dir("/");
        {
            futil::xact_mktemp tf(dir,0644);
            tf.write_all("abc",3);
            tmock::assert_equiv(fs_root->files.size(),1UL);
        }
        tmock::assert_equiv(fs_root->files.size(),0UL);

        {
            futil::xact_mktemp tf(dir,0644);
            tf.write_all("abc",3);
            futil::rename(dir,tf.name,dir,"final");
            tf.commit();
        }
        tmock::assert_equiv(fs_root->files.size(),1UL);
        tmock::assert_equiv(fs_root->files["final"]->data_as_string(),"abc");
    }
};

TMOCK_MAIN();
