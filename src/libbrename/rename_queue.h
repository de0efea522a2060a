// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_RENAME_QUEUE_H
#define __SRC_LIBBRENAME_RENAME_QUEUE_H

#include "mapping.h"
#include "config.h"
#include "state.h"
#include "debug.h"
#include <span>
#include <vector>

namespace brename
{
    // An ordered sequence of primitive renames plus a cursor.  Entries
    // [0, n_renamed) have been applied and entries [n_renamed, size()) have
    // not.  The order is fixed when the queue is built.
    struct rename_queue
    {
        std::vector<mapping>    queue;
        size_t                  n_renamed;
        configuration           config;
        debug_log               log;

        // If set, the state is saved here before the first step and after
        // every successful step.
        futil::path             checkpoint_path;

        size_t size() const {return queue.size();}
        bool done() const   {return n_renamed == queue.size();}

        std::span<const mapping> renamed() const
        {
            return std::span<const mapping>(queue.data(),n_renamed);
        }
        std::span<const mapping> pending() const
        {
            return std::span<const mapping>(queue.data() + n_renamed,
                                            queue.size() - n_renamed);
        }

        persistable_state state() const;

        void set_checkpoint(const futil::path& path)
        {
            checkpoint_path = path;
        }

        // Applies pending entries in order.  Stops at the first failure with
        // the cursor pointing at the entry that failed.
        void apply();

        // Undoes applied entries in reverse order.  Stops at the first
        // failure with the cursor just past the entry that failed.
        void revert();

        // As apply(), but reverts on failure.  If the revert also fails, an
        // atomic_action_failed_exception holding both errors is thrown;
        // otherwise the original error is rethrown.  The revert keeps
        // renaming even if the checkpoint can't be saved along the way.
        void apply_atomic();

        // As revert(), but applies again on failure.
        void revert_atomic();

        // Validates and resolves raw pairs into a new queue.
        static rename_queue plan(const std::vector<mapping>& pairs,
                                 const configuration& config =
                                    default_configuration);

        rename_queue(std::vector<mapping> queue,
                     const configuration& config = default_configuration);
        rename_queue(const persistable_state& s,
                     const configuration& config = default_configuration);

    protected:
        void step(const mapping& m);
        void step_forward();
        void step_backward();
        void compensate(bool forward);
        void checkpoint() const;
        bool try_checkpoint() const;
    };

    // Runs apply_atomic() or revert_atomic() on q and keeps the state file
    // at state_path current.  With config.checkpoint off the state is saved
    // once at the end, and also when the action fails with the queue left
    // partly applied.
    void run_atomic(rename_queue& q, void (rename_queue::*action)(),
                    const futil::path& state_path);
}

#endif /* __SRC_LIBBRENAME_RENAME_QUEUE_H */
