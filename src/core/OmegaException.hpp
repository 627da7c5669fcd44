//
// OmegaException.hpp
//

#ifndef DOUDIZHU_OMEGAEXCEPTION_HPP
#define DOUDIZHU_OMEGAEXCEPTION_HPP
#include <algorithm>
#include <cstddef>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace ddz::core
{
    // Exception carrying a typed code, the throw site and a stack trace.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{backtrace}
        {
        }

        [[nodiscard]]
        auto what() -> std::string& { return err_str_; }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() -> T& { return usr_data_; }
        auto data() const noexcept -> T const& { return usr_data_; }

        // One line for table logs: message plus throw site.
        [[nodiscard]]
        auto summary() const -> std::string
        {
            return std::format("{} [{}:{}]", err_str_, src_loc_.file_name(), src_loc_.line());
        }

        // Throw site and up to max_frames frames, without the runtime frames below main.
        [[nodiscard]]
        auto to_str(std::size_t max_frames = 32) const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            std::size_t const own = backtrace_.size() > 3 ? backtrace_.size() - 3 : backtrace_.size();
            std::size_t const n = std::min(own, max_frames);
            for (std::size_t i{}; i < n; ++i)
            {
                auto const& f = backtrace_[i];
                s += std::format("  #{} {}({}):{}\n", i, f.source_file(), f.source_line(), f.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location const src_loc_;
        std::stacktrace backtrace_;
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<ddz::core::OmegaException<T>> : std::formatter<std::string_view>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return std::formatter<std::string_view>::parse(ctx);
    }

    template <class FormatContext>
    auto format(ddz::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("[error {}] {}\n{}", static_cast<int>(p.data()), p.what(), p.to_str(8));
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //DOUDIZHU_OMEGAEXCEPTION_HPP