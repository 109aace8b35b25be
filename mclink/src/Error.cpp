#include "mclink/Error.hpp"

#include <magic_enum/magic_enum.hpp>

#include <string>

namespace
{
    class McErrorCategory : public std::error_category
    {
      public:
        const char* name() const noexcept override { return "McError"; }

        std::string message(int ev) const override
        {
            auto name{ magic_enum::enum_name(static_cast<mclink::McError>(ev)) };
            if (name.empty()) {
                return "Unknown";
            }
            return std::string(name);
        }
    };
}

namespace mclink
{
    auto mc_category() noexcept -> const std::error_category&
    {
        static McErrorCategory instance;
        return instance;
    }

    auto make_error_code(McError e) noexcept -> std::error_code
    {
        return std::error_code(static_cast<int>(e), mc_category());
    }
} // namespace mclink
