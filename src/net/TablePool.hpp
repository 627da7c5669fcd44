//
// TablePool.hpp
//

#ifndef DOUDIZHU_TABLEPOOL_HPP
#define DOUDIZHU_TABLEPOOL_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "TableActor.hpp"

namespace ddz::core::net
{
    // The running tables of one server, each on its own thread. Not thread safe:
    // the owner serializes calls (the server does so under its connection mutex).
    class TablePool
    {
    public:
        TablePool() = default;
        ~TablePool();

        TablePool(TablePool const&) = delete;
        auto operator=(TablePool const&) -> TablePool& = delete;

        // Reaps first, then runs table->Run() on a new thread; on_closed runs on that
        // thread once Run() returns.
        auto Launch(std::shared_ptr<TableActor> table, std::function<void()> on_closed = {}) -> void;

        // Joins and drops finished tables. Returns how many were dropped.
        auto Reap() -> std::size_t;

        auto JoinAll() -> void;

        auto Size() const noexcept -> std::size_t { return running_.size(); }

    private:
        struct Running
        {
            std::shared_ptr<TableActor> table;
            std::thread thread;
        };

        std::vector<Running> running_;
    };
}

#endif //DOUDIZHU_TABLEPOOL_HPP
