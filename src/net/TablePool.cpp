//
// TablePool.cpp
//
#include "TablePool.hpp"

#include <utility>

namespace ddz::core::net
{
    TablePool::~TablePool()
    {
        JoinAll();
    }

    auto TablePool::Launch(std::shared_ptr<TableActor> table, std::function<void()> on_closed) -> void
    {
        Reap();
        std::thread runner([table, on_closed = std::move(on_closed)]()
        {
            table->Run();
            if (on_closed) on_closed();
        });
        running_.push_back(Running{std::move(table), std::move(runner)});
    }

    auto TablePool::Reap() -> std::size_t
    {
        // Finished() flips as Run() returns, so these joins are short
        return std::erase_if(running_, [](Running& r)
        {
            if (!r.table->Finished()) return false;
            if (r.thread.joinable()) r.thread.join();
            return true;
        });
    }

    auto TablePool::JoinAll() -> void
    {
        for (auto& r : running_)
        {
            if (r.thread.joinable()) r.thread.join();
        }
        running_.clear();
    }
}
