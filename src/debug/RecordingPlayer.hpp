//
// RecordingPlayer.hpp
//

#ifndef DOUDIZHU_RECORDINGPLAYER_HPP
#define DOUDIZHU_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace ddz::core::debug
{
    // Decorator keeping every action the wrapped player produced, in order.
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Play(std::shared_ptr<const GameSnapshot> s,
                  std::chrono::steady_clock::time_point deadline) -> PlayerAction override
        {
            history_.push_back(inner_->Play(std::move(s), deadline));
            return history_.back();
        }

        auto Label() const -> std::string_view override
        {
            return inner_->Label();
        }

        auto HasLast() const -> bool
        {
            return !history_.empty();
        }

        auto Last() const -> PlayerAction const&
        {
            return history_.back();
        }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<PlayerAction> history_;
    };

    // Helper to wrap a vector<unique_ptr<Player>>; null seats stay null
    inline auto WrapRecording(std::vector<std::unique_ptr<Player>>& players)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> out;
        out.reserve(players.size());

        for (auto& p : players)
        {
            if (p) out.emplace_back(std::make_unique<RecordingPlayer>(std::move(p)));
            else out.emplace_back(nullptr);
        }

        return out;
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
} // namespace ddz::core::debug

#endif //DOUDIZHU_RECORDINGPLAYER_HPP
