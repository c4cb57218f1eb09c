#pragma once
#include "isolate/util.h"
#include <v8.h>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace jsbox {
namespace detail {

struct ParamIncorrect : std::exception {
	const char* type;
	explicit ParamIncorrect(const char* type) : type{type} {}
};

template <class Type>
struct ConvertParam;

template <>
struct ConvertParam<std::string> {
	static auto Convert(v8::Local<v8::Value> value) -> std::string {
		if (!value->IsString()) {
			throw ParamIncorrect{"a string"};
		}
		return to_string(v8::Isolate::GetCurrent(), value);
	}
};

template <>
struct ConvertParam<bool> {
	static auto Convert(v8::Local<v8::Value> value) -> bool {
		if (!value->IsBoolean()) {
			throw ParamIncorrect{"a boolean"};
		}
		return value->IsTrue();
	}
};

// Non-negative integers which fit a double exactly
template <>
struct ConvertParam<uint64_t> {
	static auto Convert(v8::Local<v8::Value> value) -> uint64_t {
		if (!value->IsNumber()) {
			throw ParamIncorrect{"a number"};
		}
		double number = value.As<v8::Number>()->Value();
		constexpr double kMaxSafeInteger = 9007199254740991.0;
		if (!std::isfinite(number) || number < 0 || number > kMaxSafeInteger || std::floor(number) != number) {
			throw ParamIncorrect{"a non-negative integer"};
		}
		return static_cast<uint64_t>(number);
	}
};

template <class Type>
auto ConvertOrThrow(v8::Local<v8::Value> value, const std::string& name) -> Type {
	try {
		return ConvertParam<Type>::Convert(value);
	} catch (const ParamIncorrect& ex) {
		throw InputError{"`" + name + "` must be " + ex.type};
	}
}

} // namespace detail

/**
 * Reads a required positional argument
 */
template <class Type>
auto ReadArgument(const v8::FunctionCallbackInfo<v8::Value>& info, int index, const char* name) -> Type {
	if (info.Length() <= index || info[index]->IsUndefined()) {
		throw InputError{std::string{"`"} + name + "` is required"};
	}
	return detail::ConvertOrThrow<Type>(info[index], name);
}

/**
 * Reads a property of an options object. Missing options, and `null` or `undefined` values, read as
 * `std::nullopt`.
 */
template <class Type>
auto ReadOption(v8::MaybeLocal<v8::Object> maybe_options, const char* property) -> std::optional<Type> {
	v8::Local<v8::Object> options;
	if (!maybe_options.ToLocal(&options)) {
		return std::nullopt;
	}
	auto context = v8::Isolate::GetCurrent()->GetCurrentContext();
	v8::Local<v8::Value> value = Unmaybe(options->Get(context, v8_symbol(property)));
	if (value->IsNullOrUndefined()) {
		return std::nullopt;
	}
	return detail::ConvertOrThrow<Type>(value, property);
}

/**
 * Reads an optional options object argument
 */
inline auto ReadOptions(const v8::FunctionCallbackInfo<v8::Value>& info, int index) -> v8::MaybeLocal<v8::Object> {
	if (info.Length() <= index || info[index]->IsNullOrUndefined()) {
		return {};
	}
	if (!info[index]->IsObject()) {
		throw InputError{"`options` must be an object"};
	}
	return info[index].As<v8::Object>();
}

} // namespace jsbox
