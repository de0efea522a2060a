// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "rename_queue.h"
#include "validate.h"
#include "resolve.h"
#include "exception.h"
#include <futil/xact.h>
#include <optional>

brename::rename_queue::rename_queue(std::vector<mapping> queue,
    const configuration& config):
        queue(std::move(queue)),
        n_renamed(0),
        config(config),
        log(config.debug)
{
}

brename::rename_queue::rename_queue(const persistable_state& s,
    const configuration& config):
        queue(s.renamed),
        n_renamed(s.renamed.size()),
        config(config),
        log(config.debug)
{
    queue.insert(queue.end(),s.pending.begin(),s.pending.end());
}

brename::rename_queue
brename::rename_queue::plan(const std::vector<mapping>& pairs,
    const configuration& config)
{
    return rename_queue(resolve(validate(pairs),debug_log(config.debug)),
                        config);
}

brename::persistable_state
brename::rename_queue::state() const
{
    auto r = renamed();
    auto p = pending();
    return persistable_state{std::vector<mapping>(r.begin(),r.end()),
                             std::vector<mapping>(p.begin(),p.end())};
}

void
brename::rename_queue::checkpoint() const
{
    if (checkpoint_path.empty())
        return;

    save_state(state(),checkpoint_path);
    log.debugf("checkpoint: %zu renamed, %zu pending\n",
               n_renamed,queue.size() - n_renamed);
}

void
brename::rename_queue::step(const mapping& m)
{
    try
    {
        if (futil::exists(m.dst))
            throw already_exists_exception(m.src,m.dst);
    }
    catch (const futil::errno_exception& e)
    {
        throw io_exception("stat",e.errnov,m.dst);
    }

    if (config.require_file_or_symlink)
    {
        struct stat st;
        try
        {
            st = futil::lstat(m.src);
        }
        catch (const futil::errno_exception& e)
        {
            throw io_exception("stat",e.errnov,m.src);
        }
        if (!S_ISREG(st.st_mode) && !S_ISLNK(st.st_mode))
            throw not_file_or_symlink_exception(m.src);
    }

    // Directories created for dst are removed again if the rename fails.
    auto parent = m.dst.parent();
    std::optional<futil::xact_mkdir_all> mx;
    if (config.create_parent_dirs && !parent.empty())
    {
        try
        {
            mx.emplace(parent,0777);
        }
        catch (const futil::errno_exception& e)
        {
            throw io_exception("mkdir",e.errnov,parent);
        }
    }

    // The rename itself refuses to replace, so a dst created after the check
    // above still fails safely.
    bool renamed;
    try
    {
        renamed = futil::rename_if_not_exists(m.src,m.dst);
    }
    catch (const futil::errno_exception& e)
    {
        throw io_exception("rename",e.errnov,m.src,m.dst);
    }
    if (!renamed)
        throw already_exists_exception(m.src,m.dst);
    if (mx)
        mx->commit();
}

bool
brename::rename_queue::try_checkpoint() const
{
    try
    {
        checkpoint();
        return true;
    }
    catch (const brename::exception& e)
    {
        log.debugf("checkpoint failed: %s\n",e.what());
        return false;
    }
}

void
brename::rename_queue::step_forward()
{
    step(queue[n_renamed]);
    ++n_renamed;
    log.debugf("apply %zu/%zu: %s\n",n_renamed,queue.size(),
               to_string(queue[n_renamed - 1]).c_str());
}

void
brename::rename_queue::step_backward()
{
    step(queue[n_renamed - 1].invert());
    --n_renamed;
    log.debugf("revert %zu/%zu: %s\n",n_renamed + 1,queue.size(),
               to_string(queue[n_renamed].invert()).c_str());
}

void
brename::rename_queue::apply()
{
    checkpoint();
    while (!done())
    {
        step_forward();
        checkpoint();
    }
}

void
brename::rename_queue::revert()
{
    checkpoint();
    while (n_renamed)
    {
        step_backward();
        checkpoint();
    }
}

void
brename::rename_queue::compensate(bool forward)
{
    // Checkpoint failures don't stop the compensating renames.  Only a
    // failure to save the final position is reported.
    bool saved = true;
    try
    {
        while (forward ? !done() : n_renamed != 0)
        {
            if (forward)
                step_forward();
            else
                step_backward();
            saved = try_checkpoint();
        }
    }
    catch (const brename::exception&)
    {
        try_checkpoint();
        throw;
    }
    if (!saved)
        checkpoint();
}

void
brename::rename_queue::apply_atomic()
{
    try
    {
        apply();
    }
    catch (const brename::exception&)
    {
        auto attempt = std::current_exception();
        log.debugf("apply failed, reverting\n");
        try
        {
            compensate(false);
        }
        catch (const brename::exception&)
        {
            throw atomic_action_failed_exception(attempt,
                                                 std::current_exception());
        }
        throw;
    }
}

void
brename::rename_queue::revert_atomic()
{
    try
    {
        revert();
    }
    catch (const brename::exception&)
    {
        auto attempt = std::current_exception();
        log.debugf("revert failed, applying\n");
        try
        {
            compensate(true);
        }
        catch (const brename::exception&)
        {
            throw atomic_action_failed_exception(attempt,
                                                 std::current_exception());
        }
        throw;
    }
}

void
brename::run_atomic(rename_queue& q, void (rename_queue::*action)(),
    const futil::path& state_path)
{
    if (q.config.checkpoint)
    {
        q.set_checkpoint(state_path);
        (q.*action)();
        return;
    }

    try
    {
        (q.*action)();
    }
    catch (const atomic_action_failed_exception&)
    {
        try
        {
            save_state(q.state(),state_path);
        }
        catch (const brename::exception& e)
        {
            fprintf(stderr,"Error: %s\n",e.what());
        }
        throw;
    }
    save_state(q.state(),state_path);
}
