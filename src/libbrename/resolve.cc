// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "resolve.h"
#include "exception.h"
#include <deque>
#include <map>
#include <set>

// Returns true if p is an ancestor of any path in paths.  Descendants of p
// sort contiguously just after p + "/".
static bool
is_ancestor_of_any(const futil::path& p, const std::set<std::string>& paths)
{
    auto iter = paths.lower_bound(p._path + "/");
    return iter != paths.end() && p.is_ancestor_of(futil::path(*iter));
}

static futil::path
make_temp_path(const futil::path& p, std::set<std::string>& taken) try
{
    for (size_t i = 0;; ++i)
    {
        auto candidate = p.with_extension("temp_" + std::to_string(i));
        if (taken.contains(candidate._path))
            continue;
        if (is_ancestor_of_any(candidate,taken))
            continue;
        if (futil::exists(candidate))
            continue;

        taken.insert(candidate._path);
        return candidate;
    }
}
catch (const futil::errno_exception& e)
{
    throw brename::io_exception("stat",e.errnov,p);
}

std::vector<brename::mapping>
brename::resolve(const std::vector<mapping>& validated, const debug_log& log)
{
    std::map<std::string,const mapping*> by_src;
    std::set<std::string> taken;
    for (auto& m : validated)
    {
        taken.insert(m.src._path);
        taken.insert(m.dst._path);
        if (!m.is_noop())
            by_src.emplace(m.src._path,&m);
    }

    std::vector<mapping> queue;
    std::set<std::string> visited;
    for (auto& m : validated)
    {
        if (m.is_noop() || visited.contains(m.src._path))
            continue;

        // Follow the chain from m until it ends, reaches a node that an
        // earlier walk already ordered, or closes back on m.src.
        std::deque<mapping> walk;
        visited.insert(m.src._path);
        walk.push_front(m);
        futil::path cur = m.dst;
        for (;;)
        {
            auto iter = by_src.find(cur._path);
            if (iter == by_src.end() || visited.contains(cur._path))
                break;

            visited.insert(cur._path);
            const futil::path& next = iter->second->dst;
            if (next._path == m.src._path)
            {
                auto temp = make_temp_path(cur,taken);
                log.debugf("resolve: cycle at %s, using %s\n",
                           cur.c_str(),temp.c_str());
                walk.push_front(mapping{cur,temp});
                walk.push_back(mapping{temp,m.src});
                break;
            }

            walk.push_front(mapping{cur,next});
            cur = next;
        }

        for (auto& w : walk)
        {
            log.debugf("resolve: %s\n",to_string(w).c_str());
            queue.push_back(w);
        }
    }

    return queue;
}
