#pragma once

#include <fmt/core.h>
#include <outcome.hpp>

#include <cassert>
#include <cstdlib>
#include <cstring>
#include <source_location>
#include <string>

#define TRY(...) OUTCOME_TRY(__VA_ARGS__)
#define TRYV(...) OUTCOME_TRYV(__VA_ARGS__)

#if defined(__GNUC__) || defined(__clang__)
#define TRYX(...) OUTCOME_TRYX(__VA_ARGS__)
#endif

namespace outcome = OUTCOME_V2_NAMESPACE::experimental;

namespace chunkview {

template <typename R,
          typename S = outcome::erased_errored_status_code<
              typename outcome::system_code::value_type>,
          typename NoValuePolicy =
              outcome::policy::default_status_result_policy<R, S>>
using Result = outcome::status_result<R, S, NoValuePolicy>;

}  // namespace chunkview

template <>
struct fmt::formatter<SYSTEM_ERROR2_NAMESPACE::status_code_domain::string_ref>
    : fmt::formatter<std::string_view> {
  using T = SYSTEM_ERROR2_NAMESPACE::status_code_domain::string_ref;
  template <typename FormatContext>
  auto format(const T &c, FormatContext &ctx) const -> decltype(ctx.out()) {
    auto s = std::string_view{c.data(), c.size()};
    return fmt::formatter<std::string_view>::format(s, ctx);
  }
};

template <typename T>
  requires outcome::is_status_code<T>::value ||
           outcome::is_errored_status_code<T>::value
struct fmt::formatter<T> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const T &c, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "ErrorDomain={} {}", c.domain().name(),
                          c.message());
  }
};

template <>
struct fmt::formatter<std::source_location> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const std::source_location &location, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    std::string_view v{location.file_name()};
    return fmt::format_to(ctx.out(), "{}:{}", v.substr(v.find_last_of('/') + 1),
                          location.line());
  }
};

SYSTEM_ERROR2_NAMESPACE_BEGIN

namespace detail {
using string_ref = status_code_domain::string_ref;
using atomic_refcounted_string_ref =
    status_code_domain::atomic_refcounted_string_ref;

inline string_ref to_string_ref(const std::string &s) {
  auto p = (char *)malloc(s.size());   // NOLINT
  std::memcpy(p, s.data(), s.size());  // NOLINT
  return atomic_refcounted_string_ref{p, s.size()};
}
}  // namespace detail

template <typename Enum, typename = void>
struct HasQuickEnum : std::false_type {};

template <typename Enum>
struct HasQuickEnum<Enum, std::void_t<quick_status_code_from_enum<Enum>>>
    : std::true_type {};

template <typename Enum>
concept QuickEnum = std::is_enum_v<Enum> && HasQuickEnum<Enum>::value &&
                    requires {
                      { quick_status_code_from_enum<Enum>::payload_uuid };
                    };

// Error carrying an enum value, a message payload and the raise site.
template <typename Enum>
struct PayloadDomainImpl;

template <typename Enum>
using PayloadError = status_code<PayloadDomainImpl<Enum>>;

template <typename Enum>
struct PayloadDomainImpl final : public status_code_domain {
  using Base = status_code_domain;
  using Quick = quick_status_code_from_enum<Enum>;
  using Self = PayloadError<Enum>;

  struct value_type {
    Enum value{};
    std::string payload;
    std::source_location loc = std::source_location::current();
  };

  static constexpr size_t uuid_size = detail::cstrlen(Quick::payload_uuid);
  static constexpr uint64_t payload_uuid =
      detail::parse_uuid_from_pointer<uuid_size>(Quick::payload_uuid);

  constexpr PayloadDomainImpl() : Base(payload_uuid) {}
  PayloadDomainImpl(const PayloadDomainImpl &) = default;
  PayloadDomainImpl(PayloadDomainImpl &&) = default;
  PayloadDomainImpl &operator=(const PayloadDomainImpl &) = default;
  PayloadDomainImpl &operator=(PayloadDomainImpl &&) = default;
  ~PayloadDomainImpl() = default;

  static const typename Quick::mapping *find_mapping(Enum v) {
    for (const auto &i : Quick::value_mappings()) {
      if (i.value == v) {
        return &i;
      }
    }
    return nullptr;
  }

  string_ref name() const noexcept final {
    return string_ref{Quick::domain_name};
  }

  payload_info_t payload_info() const noexcept final {
    return {sizeof(value_type),
            sizeof(status_code_domain *) + sizeof(value_type),
            (alignof(value_type) > alignof(status_code_domain *))
                ? alignof(value_type)
                : alignof(status_code_domain *)};
  }

  static constexpr const PayloadDomainImpl &get();

  bool _do_failure(const status_code<void> & /*code*/) const noexcept final {
    return true;
  }

  bool _do_equivalent(const status_code<void> &code1,
                      const status_code<void> &code2) const noexcept final {
    assert(code1.domain() == *this);
    const auto &c1 = static_cast<const Self &>(code1);  // NOLINT
    if (code2.domain() == *this) {
      const auto &c2 = static_cast<const Self &>(code2);  // NOLINT
      return c1.value().value == c2.value().value;
    }

    // nested copy produced by make_nested_status_code
    if (code1.domain().id() == (code2.domain().id() ^ 0xc44f7bdeb2cc50e9)) {
      using IndirectCode = status_code<
          detail::indirecting_domain<Self, std::allocator<Self>>>;
      const auto &c2 = static_cast<const IndirectCode &>(code2);  // NOLINT
      return c1.value().value == c2.value()->sc.value().value;
    }

    if (code2.domain() == quick_status_code_from_enum_domain<Enum>) {
      using QuickCode = quick_status_code_from_enum_code<Enum>;
      const auto &c2 = static_cast<const QuickCode &>(code2);  // NOLINT
      return c1.value().value == c2.value();
    }

    if (code2.domain() == generic_code_domain) {
      const auto &c2 = static_cast<const generic_code &>(code2);  // NOLINT
      const auto *m = find_mapping(c1.value().value);
      assert(m != nullptr);
      for (auto ec : m->code_mappings) {
        if (ec == c2.value()) {
          return true;
        }
      }
    }
    return false;
  }

  generic_code _generic_code(
      const status_code<void> &code) const noexcept final {
    assert(code.domain() == *this);
    const auto &c = static_cast<const Self &>(code);  // NOLINT
    const auto *m = find_mapping(c.value().value);
    assert(m != nullptr);
    if (m->code_mappings.size() > 0) {
      return *m->code_mappings.begin();
    }
    return errc::unknown;
  }

  string_ref _do_message(const status_code<void> &code) const noexcept final {
    assert(code.domain() == *this);
    const auto &v = static_cast<const Self &>(code).value();  // NOLINT
    const auto *m = find_mapping(v.value);
    assert(m != nullptr);
    if (v.payload.empty()) {
      return detail::to_string_ref(fmt::format("{} {}", v.loc, m->message));
    }
    return detail::to_string_ref(
        fmt::format("{} {}: {}", v.loc, m->message, v.payload));
  }

  void _do_throw_exception(const status_code<void> &code) const final {
    assert(code.domain() == *this);
    const auto &c = static_cast<const Self &>(code);  // NOLINT
    throw status_error<PayloadDomainImpl>(c);
  }
};

template <typename Enum>
constexpr PayloadDomainImpl<Enum> PayloadDomain = {};

template <typename Enum>
constexpr const PayloadDomainImpl<Enum> &PayloadDomainImpl<Enum>::get() {
  return PayloadDomain<Enum>;
}

template <typename Enum>
inline system_code make_status_code(PayloadError<Enum> e) {
  return make_nested_status_code(std::move(e));
}

/// make_error factory functions

template <typename Enum>
  requires QuickEnum<Enum>
PayloadError<Enum> make_error(
    Enum e, std::source_location loc = std::source_location::current()) {
  return PayloadError<Enum>({e, std::string{}, loc});
}

template <typename Enum, typename Payload>
  requires QuickEnum<Enum> && std::convertible_to<Payload, std::string>
PayloadError<Enum> make_error(
    Enum e, Payload &&payload,
    std::source_location loc = std::source_location::current()) {
  return PayloadError<Enum>(
      {e, std::string(std::forward<Payload>(payload)), loc});
}

// True when `code` was raised with enum value `e`, nested or not.
template <typename Enum>
  requires QuickEnum<Enum>
bool is_error(const status_code<void> &code, Enum e) {
  return code.equivalent(quick_status_code_from_enum_code<Enum>(in_place, e));
}

SYSTEM_ERROR2_NAMESPACE_END

namespace chunkview {
using SYSTEM_ERROR2_NAMESPACE::is_error;
using SYSTEM_ERROR2_NAMESPACE::make_error;
}  // namespace chunkview
