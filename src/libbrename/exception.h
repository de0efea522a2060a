// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_EXCEPTION_H
#define __SRC_LIBBRENAME_EXCEPTION_H

#include <futil/futil.h>
#include <strutil/strutil.h>
#include <exception>
#include <string>
#include <string.h>

namespace brename
{
    enum status_code
    {
        IO_ERROR                = -1,
        ONE_TO_MANY             = -2,
        MANY_TO_ONE             = -3,
        NON_LEAF_NODE           = -4,
        ALREADY_EXISTS          = -5,
        NOT_FILE_OR_SYMLINK     = -6,
        ATOMIC_ACTION_FAILED    = -7,
        EMPTY_PATH              = -8,
        INVALID_STATE_FILE      = -9,
        INVALID_CONFIG_FILE     = -10,
    };

    struct exception : public std::exception
    {
        const status_code   sc;
        const std::string   message;

        virtual const char* what() const noexcept override
        {
            return message.c_str();
        }

        exception(status_code sc, const std::string& message):
            sc(sc),
            message(message)
        {
        }
    };

    // A filesystem call failed.  op names the operation and path2 is empty
    // for single-path operations.
    struct io_exception : public exception
    {
        const int           errnov;
        const std::string   op;
        const futil::path   path1;
        const futil::path   path2;

        io_exception(const std::string& op, int errnov,
                     const futil::path& path1,
                     const futil::path& path2 = futil::path()):
            exception(IO_ERROR,
                      path2.empty() ?
                        str::printf("I/O error during %s of \"%s\": %s",
                                    op.c_str(),path1.c_str(),
                                    strerror(errnov)) :
                        str::printf("I/O error during %s of \"%s\" to "
                                    "\"%s\": %s",
                                    op.c_str(),path1.c_str(),path2.c_str(),
                                    strerror(errnov))),
            errnov(errnov),
            op(op),
            path1(path1),
            path2(path2)
        {
        }
    };

    struct one_to_many_exception : public exception
    {
        const futil::path   src;
        const futil::path   dst1;
        const futil::path   dst2;

        one_to_many_exception(const futil::path& src, const futil::path& dst1,
                              const futil::path& dst2):
            exception(ONE_TO_MANY,
                      str::printf("Source \"%s\" is mapped to both \"%s\" "
                                  "and \"%s\".",
                                  src.c_str(),dst1.c_str(),dst2.c_str())),
            src(src),
            dst1(dst1),
            dst2(dst2)
        {
        }
    };

    struct many_to_one_exception : public exception
    {
        const futil::path   src1;
        const futil::path   src2;
        const futil::path   dst;

        many_to_one_exception(const futil::path& src1, const futil::path& src2,
                              const futil::path& dst):
            exception(MANY_TO_ONE,
                      str::printf("Sources \"%s\" and \"%s\" are both mapped "
                                  "to \"%s\".",
                                  src1.c_str(),src2.c_str(),dst.c_str())),
            src1(src1),
            src2(src2),
            dst(dst)
        {
        }
    };

    struct non_leaf_node_exception : public exception
    {
        const futil::path   ancestor;
        const futil::path   descendant;

        non_leaf_node_exception(const futil::path& ancestor,
                                const futil::path& descendant):
            exception(NON_LEAF_NODE,
                      str::printf("Path \"%s\" is an ancestor of \"%s\"; "
                                  "only leaf paths may be renamed.",
                                  ancestor.c_str(),descendant.c_str())),
            ancestor(ancestor),
            descendant(descendant)
        {
        }
    };

    struct already_exists_exception : public exception
    {
        const futil::path   src;
        const futil::path   dst;

        already_exists_exception(const futil::path& src,
                                 const futil::path& dst):
            exception(ALREADY_EXISTS,
                      str::printf("Cannot rename \"%s\" to \"%s\": the "
                                  "destination already exists.",
                                  src.c_str(),dst.c_str())),
            src(src),
            dst(dst)
        {
        }
    };

    struct not_file_or_symlink_exception : public exception
    {
        const futil::path   src;

        not_file_or_symlink_exception(const futil::path& src):
            exception(NOT_FILE_OR_SYMLINK,
                      str::printf("Source \"%s\" is neither a regular file "
                                  "nor a symbolic link.",src.c_str())),
            src(src)
        {
        }
    };

    // Returns the what() text of a captured exception.
    inline std::string describe(std::exception_ptr ep)
    {
        try
        {
            std::rethrow_exception(ep);
        }
        catch (const std::exception& e)
        {
            return e.what();
        }
    }

    // An atomic apply or revert failed and the compensating action failed
    // too.  Either captured error may itself be an
    // atomic_action_failed_exception.
    struct atomic_action_failed_exception : public exception
    {
        const std::exception_ptr    attempt;
        const std::exception_ptr    rollback;

        atomic_action_failed_exception(std::exception_ptr attempt,
                                       std::exception_ptr rollback):
            exception(ATOMIC_ACTION_FAILED,
                      "Atomic action failed:\n"
                      "  attempt:  " + describe(attempt) + "\n"
                      "  rollback: " + describe(rollback)),
            attempt(attempt),
            rollback(rollback)
        {
        }
    };

    struct empty_path_exception : public exception
    {
        empty_path_exception():
            exception(EMPTY_PATH,"Empty path in mapping.")
        {
        }
    };

    struct invalid_state_file_exception : public exception
    {
        invalid_state_file_exception(const std::string& reason):
            exception(INVALID_STATE_FILE,"Invalid state file: " + reason)
        {
        }
    };

    struct invalid_config_file_exception : public exception
    {
        invalid_config_file_exception(const std::string& reason):
            exception(INVALID_CONFIG_FILE,
                      "Invalid configuration file: " + reason)
        {
        }
    };
}

#endif /* __SRC_LIBBRENAME_EXCEPTION_H */
