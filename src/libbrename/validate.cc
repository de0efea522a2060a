// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "validate.h"
#include "exception.h"
#include <algorithm>
#include <map>
#include <set>

std::vector<brename::mapping>
brename::validate(const std::vector<mapping>& pairs)
{
    std::vector<mapping> v;
    std::map<std::string,std::string> forward;
    for (auto& p : pairs)
    {
        if (p.src.empty() || p.dst.empty())
            throw empty_path_exception();

        mapping m{p.src.absolute(),p.dst.absolute()};
        auto iter = forward.find(m.src._path);
        if (iter != forward.end())
        {
            if (iter->second != m.dst._path)
                throw one_to_many_exception(m.src,iter->second,m.dst);
            continue;
        }

        forward.emplace(m.src._path,m.dst._path);
        v.push_back(m);
    }

    std::map<std::string,std::string> reverse;
    for (auto& m : v)
    {
        auto [iter, inserted] = reverse.emplace(m.dst._path,m.src._path);
        if (!inserted)
            throw many_to_one_exception(iter->second,m.src,m.dst);
    }

    // After sorting by components, any descendant of a path immediately
    // follows it.
    std::set<std::string> distinct;
    for (auto& m : v)
    {
        distinct.insert(m.src._path);
        distinct.insert(m.dst._path);
    }
    std::vector<std::vector<std::string>> components;
    for (auto& s : distinct)
        components.push_back(futil::path(s).decompose());
    std::sort(components.begin(),components.end());
    for (size_t i=1; i<components.size(); ++i)
    {
        auto a = futil::path::compose(components[i-1]);
        auto b = futil::path::compose(components[i]);
        if (a.is_ancestor_of(b))
            throw non_leaf_node_exception(a,b);
    }

    return v;
}
