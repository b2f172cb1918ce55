/**
 * @file Types.hpp
 * @brief Short type aliases used throughout termflex.
 *
 * Layout code deals almost exclusively in cell counts, strings and small
 * vectors, so these aliases keep signatures readable.
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::map (UnorderedMap)
#include <array>                    // std::array (Array)
#include <cstdint>                  // std::{u,}int{8,16,32,64}_t
#include <expected>                 // std::expected (Result)
#include <functional>               // std::function (Fn)
#include <map>                      // std::map (Map)
#include <memory>                   // std::unique_ptr (UniquePointer)
#include <mutex>                    // std::mutex, std::lock_guard (Mutex, LockGuard)
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <utility>                  // std::pair (Pair)
#include <vector>                   // std::vector (Vec)

namespace termflex::utils {
  namespace error {
    struct TermflexError;
  } // namespace error

  namespace types {
    // Fixed-width integers
    using u8  = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;
    using i8  = std::int8_t;
    using i16 = std::int16_t;
    using i32 = std::int32_t;
    using i64 = std::int64_t;

    // Floating point
    using f32 = float;
    using f64 = double;

    // Sizes
    using usize = std::size_t;
    using isize = std::ptrdiff_t;

    // Strings
    using String     = std::string;
    using StringView = std::string_view;
    using CStr       = char;
    using PCStr      = const char*;

    /**
     * @brief Unit type for functions that only report success or failure.
     */
    using Unit = void;

    using Exception = std::exception;
    using Mutex     = std::mutex;
    using LockGuard = std::lock_guard<Mutex>;

    /**
     * @brief A value that may be absent.
     * @tparam Tp The contained type.
     */
    template <typename Tp>
    using Option = std::optional<Tp>;

    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Wraps a value in an Option.
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

    template <typename T1, typename T2>
    using Pair = std::pair<T1, T2>;

    /**
     * @brief Ordered map with transparent comparison (heterogeneous lookup).
     */
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /**
     * @brief Open-addressing hash map from ankerl::unordered_dense.
     */
    template <typename Key, typename Val>
    using UnorderedMap = ankerl::unordered_dense::map<Key, Val>;

    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    template <typename Tp>
    using Fn = std::function<Tp>;

    /**
     * @typedef Result
     * @brief Either a success value of type Tp or an error of type Er.
     */
    template <typename Tp = Unit, typename Er = error::TermflexError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Constructs a Result in its error state.
     */
    template <typename Er = error::TermflexError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace termflex::utils
