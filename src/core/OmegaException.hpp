//
// OmegaException.hpp
//

#ifndef BLACKJACKSIM_OMEGAEXCEPTION_HPP
#define BLACKJACKSIM_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace blackjack::core
{
    // Error carrying a typed payload and the throw site. T is usually error::Code;
    // the formatter below looks up `to_string(T)` by ADL.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T code,
                       std::source_location const& src_loc = std::source_location::current()) :
            err_str_{std::move(err_str)},
            code_{std::move(code)},
            src_loc_{src_loc}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto data() const noexcept -> T const& { return code_; }

        // file(line:col) in function
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            return std::format("{}({}:{}) in `{}`", src_loc_.file_name(), src_loc_.line(),
                               src_loc_.column(), src_loc_.function_name());
        }

    private:
        std::string err_str_;
        T code_;
        std::source_location src_loc_;
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<blackjack::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(blackjack::core::OmegaException<T> const& e, FormatContext& ctx) const
    {
        std::string const s = std::format("{} error: {}\n  at {}\n", to_string(e.data()), e.what(), e.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //BLACKJACKSIM_OMEGAEXCEPTION_HPP
