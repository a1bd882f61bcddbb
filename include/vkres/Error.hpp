#pragma once
#ifndef VKRES_ERROR_HPP
#define VKRES_ERROR_HPP

#include <volk.h>

#include <cinttypes>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace vkres {

namespace error {

struct OutOfMemory {
	VkDeviceSize size;
	uint32_t memory_type;
	const char *memory_class;
	inline std::string Format() const {
		return "Out of " + std::string{memory_class} + " memory (type " + std::to_string(memory_type) + ") for " +
		       std::to_string(size) + " bytes";
	}
};
struct UnsupportedMemoryType {
	uint32_t memory_type_bits;
	const char *memory_class;
	inline std::string Format() const {
		return "No memory type in mask " + std::to_string(memory_type_bits) + " supports " +
		       std::string{memory_class};
	}
};
struct DeviceError {
	VkResult result;
	const char *call;
	inline std::string Format() const {
		return std::string{call} + " failed with VkResult " + std::to_string(static_cast<int>(result));
	}
};
struct InvalidIndex {
	std::size_t index, len;
	const char *kind;
	inline std::string Format() const {
		return std::string{kind} + " index " + std::to_string(index) + " out of range " + std::to_string(len);
	}
};
struct EmptySlot {
	std::size_t index;
	const char *kind;
	inline std::string Format() const { return std::string{kind} + " slot " + std::to_string(index) + " is empty"; }
};
struct StaleIndex {
	std::size_t index;
	uint32_t expected, actual;
	const char *kind;
	inline std::string Format() const {
		return "Stale " + std::string{kind} + " index " + std::to_string(index) + " (generation " +
		       std::to_string(expected) + ", slot at " + std::to_string(actual) + ")";
	}
};
struct InvalidType {
	std::string expected, actual;
	inline std::string Format() const { return "Invalid type downcast: expected " + expected + ", found " + actual; }
};
struct InvalidConfiguration {
	std::string reason;
	inline std::string Format() const { return "Invalid configuration: " + reason; }
};
struct InvalidAllocation {
	const char *memory_class;
	inline std::string Format() const {
		return std::string{memory_class} + " allocation is not owned by this allocator";
	}
};

} // namespace error

template <typename T, typename... Types> inline constexpr bool kIsOneOf = (std::is_same_v<T, Types> || ...);

template <typename... Errors> class Error {
private:
	std::variant<Errors...> m_err;

	template <typename...> friend class Error;

public:
	template <typename T, typename = std::enable_if_t<kIsOneOf<std::decay_t<T>, Errors...>>>
	inline Error(T &&val) : m_err{std::forward<T>(val)} {}
	template <typename... Others, typename = std::enable_if_t<(kIsOneOf<Others, Errors...> && ...) &&
	                                                          !std::is_same_v<Error<Others...>, Error>>>
	inline Error(const Error<Others...> &other)
	    : m_err{std::visit([](const auto &err) -> std::variant<Errors...> { return err; }, other.m_err)} {}

	inline std::string Format() const {
		return std::visit([](const auto &err) -> std::string { return err.Format(); }, m_err);
	}
	template <typename Visitor> inline void Visit(Visitor &&visitor) const {
		std::visit(std::forward<Visitor>(visitor), m_err);
	}
	template <typename T> inline bool Is() const { return std::holds_alternative<T>(m_err); }
	template <typename T> inline const T *Get() const { return std::get_if<T>(&m_err); }
};

using AllocError = Error<error::OutOfMemory, error::UnsupportedMemoryType, error::DeviceError,
                         error::InvalidAllocation, error::StaleIndex, error::EmptySlot, error::InvalidIndex>;
using ArenaError = Error<error::InvalidIndex, error::EmptySlot, error::StaleIndex>;
using ResourceError = Error<error::OutOfMemory, error::UnsupportedMemoryType, error::DeviceError,   //
                            error::InvalidAllocation, error::StaleIndex, error::EmptySlot,          //
                            error::InvalidIndex, error::InvalidType, error::InvalidConfiguration>;

template <typename Type, typename ErrorType> class Result {
private:
	using RType = std::conditional_t<std::is_same_v<Type, void>, std::monostate, Type>;
	std::variant<RType, ErrorType> m_res;

public:
	inline Result() : m_res{std::monostate{}} { static_assert(std::is_same_v<Type, void>); }
	template <typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Result>>>
	inline Result(T &&val) : m_res{std::forward<T>(val)} {}
	inline bool IsError() const { return m_res.index() == 1; }
	inline bool IsOK() const { return m_res.index() == 0; }
	inline const RType &GetValue() const {
		if (IsError())
			throw std::runtime_error("Result has no value");
		return std::get<0>(m_res);
	}
	inline const ErrorType &GetError() const {
		if (IsOK())
			throw std::runtime_error("Result has no error");
		return std::get<1>(m_res);
	}
	inline RType PopValue() {
		return std::visit(
		    [](auto &v) -> RType {
			    if constexpr (std::is_same_v<RType, std::decay_t<decltype(v)>>)
				    return std::move(v);
			    else
				    throw std::runtime_error("Result has no value");
		    },
		    m_res);
	}
	inline ErrorType PopError() {
		return std::visit(
		    [](auto &v) -> ErrorType {
			    if constexpr (std::is_same_v<RType, std::decay_t<decltype(v)>>)
				    throw std::runtime_error("Result has no error");
			    else
				    return std::move(v);
		    },
		    m_res);
	}
};

template <typename Type> using AllocResult = Result<Type, AllocError>;
template <typename Type> using ArenaResult = Result<Type, ArenaError>;
template <typename Type> using ResourceResult = Result<Type, ResourceError>;

} // namespace vkres

#endif
