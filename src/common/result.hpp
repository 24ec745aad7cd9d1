/**
 * @file result.hpp
 * @brief Result type for fallible geometry, configuration and trace operations
 *
 * Fiber factories, the configuration loader and the trajectory simulator
 * return a Result instead of throwing, so that a failing ray in a batch can
 * be reported and skipped without unwinding the batch loop.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

/**
 * @class Result
 * @brief Holds either a success value or an error value
 *
 * Usage:
 * @code
 * auto fiber = Cylinder::create(1e-4, 1.2e-4, 1.48, 1.46, 1.0);
 * if (fiber.is_error()) {
 *     REPORT_ERROR(ErrorMessage::format(fiber.error()));
 * }
 * @endcode
 *
 * @tparam T Type of the success value
 * @tparam E Type of the error value
 */
template<typename T, typename E>
class Result
{
public:
	/**
	 * @brief Create a successful result containing a value
	 */
	template<typename U = T>
	static Result ok(U&& value) {
		return Result(std::in_place_index<0>, std::forward<U>(value));
	}

	/**
	 * @brief Create an error result containing an error value
	 */
	template<typename F = E>
	static Result error(F&& err) {
		return Result(std::in_place_index<1>, std::forward<F>(err));
	}

	bool is_ok() const { return data_.index() == 0; }
	bool is_error() const { return data_.index() == 1; }

	/**
	 * @brief Access the success value
	 * @throws std::bad_variant_access if result is in error state
	 */
	const T& value() const& { return std::get<0>(data_); }
	T&& value() && { return std::get<0>(std::move(data_)); }

	/**
	 * @brief Access the error value
	 * @throws std::bad_variant_access if result is in success state
	 */
	const E& error() const { return std::get<1>(data_); }

private:
	template<std::size_t I, typename U>
	Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

	std::variant<T, E> data_;
};

// Specialization for operations without a success value
template<typename E>
class Result<void, E>
{
public:
	static Result ok() { return Result(std::nullopt); }

	template<typename F = E>
	static Result error(F&& err) {
		return Result(std::optional<E>(std::forward<F>(err)));
	}

	bool is_ok() const { return !error_.has_value(); }
	bool is_error() const { return error_.has_value(); }

	const E& error() const { return error_.value(); }

private:
	explicit Result(std::optional<E> error) : error_(std::move(error)) {}

	std::optional<E> error_;
};
