/**
 * @file Types.hpp
 * @brief Type aliases shared across lingo.
 *
 * Short names for the standard library and third-party containers the
 * catalog, resolver and loader are written against.
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::map (StringMap)
#include <array>                    // std::array (Array)
#include <cstdint>                  // std::{u,}int{8,16,32,64}_t
#include <expected>                 // std::expected (Result), std::unexpected (Err)
#include <functional>               // std::function (Fn)
#include <map>                      // std::map (Map)
#include <memory>                   // std::unique_ptr (UniquePointer)
#include <mutex>                    // std::mutex and std::lock_guard (Mutex, LockGuard)
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <vector>                   // std::vector (Vec)

namespace lingo::utils {
  // Forward decl for Result and Err
  namespace error {
    struct LingoError;
  } // namespace error

  namespace types {
    using u8  = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;
    using i8  = std::int8_t;
    using i16 = std::int16_t;
    using i32 = std::int32_t;
    using i64 = std::int64_t;
    using f32 = float;
    using f64 = double;

    /**
     * @brief Unsigned size type (result of sizeof).
     */
    using usize = std::size_t;

    /**
     * @brief Owning, mutable string.
     */
    using String = std::string;

    /**
     * @brief Non-owning view of a string.
     */
    using StringView = std::string_view;

    /**
     * @brief Single character type.
     */
    using CStr = char;

    /**
     * @brief Pointer to a null-terminated C-style string.
     */
    using PCStr = const char*;

    /**
     * @brief Represents a unit type.
     */
    using Unit = void;

    /**
     * @brief Standard exception type.
     */
    using Exception = std::exception;

    using Mutex     = std::mutex;
    using LockGuard = std::lock_guard<Mutex>;

    /**
     * @brief Alias for std::optional<Tp>.
     * @tparam Tp The type of the potential value.
     */
    template <typename Tp>
    using Option = std::optional<Tp>;

    /**
     * @brief Represents an empty optional value.
     */
    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Creates an Option containing the given value.
     * @tparam Tp The type of the value.
     * @param value The value to wrap in an Option.
     * @return An Option containing the value.
     */
    template <typename Tp>
    constexpr auto Some(Tp&& value) -> Option<std::remove_reference_t<Tp>> {
      return std::make_optional<std::remove_reference_t<Tp>>(std::forward<Tp>(value));
    }

    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    template <typename Tp>
    using Vec = std::vector<Tp>;

    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    /**
     * @brief Ordered map with transparent comparison.
     *
     * Used where iteration order is user-visible (listings, bundles).
     * @tparam Key The key type.
     * @tparam Val The value type.
     */
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /**
     * @brief Transparent string hash so StringMap lookups accept a StringView without allocating.
     */
    struct StringHash {
      using is_transparent = void;
      using is_avalanching = void;

      auto operator()(const StringView str) const noexcept -> u64 {
        return ankerl::unordered_dense::hash<StringView> {}(str);
      }
    };

    /**
     * @brief ankerl::unordered_dense map keyed by String with heterogeneous (StringView) lookup.
     *
     * Backs catalog key lookups and the registry's catalog index.
     * @tparam Val The value type.
     */
    template <typename Val>
    using StringMap = ankerl::unordered_dense::map<String, Val, StringHash, std::equal_to<>>;

    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    template <typename Tp>
    using Fn = std::function<Tp>;

    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = Unit, typename Er = error::LingoError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::LingoError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace lingo::utils
