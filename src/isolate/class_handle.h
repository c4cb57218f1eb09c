#pragma once
#include "util.h"
#include "lib/lockable.h"
#include <v8.h>
#include <cstddef>
#include <exception>
#include <initializer_list>
#include <memory>
#include <unordered_map>

namespace jsbox {

// Builds a JS `Error` carrying the stable error code as `error.code`
auto MakeError(ErrorKind kind, const std::string& message) -> v8::Local<v8::Value>;
// Same, from whatever is in flight in `error`
auto MakeError(const std::exception_ptr& error) -> v8::Local<v8::Value>;

namespace detail {

// Runs a function and converts C++ errors to immediate v8 errors
template <class Functor>
inline void RunBarrier(Functor fn) {
	try {
		fn();
	} catch (const RuntimeError&) {
		// A JS error is waiting in the isolate
	} catch (const SandboxError& cc_error) {
		v8::Isolate::GetCurrent()->ThrowException(MakeError(cc_error.Kind(), cc_error.GetMessage()));
	} catch (const std::exception& cc_error) {
		v8::Isolate::GetCurrent()->ThrowException(MakeError(ErrorKind::Internal, cc_error.what()));
	}
}

template <class Type>
struct TemplateHolder {
	static lockable_t<std::unordered_map<v8::Isolate*, v8::Eternal<v8::FunctionTemplate>>> templates;
};

template <class Type>
lockable_t<std::unordered_map<v8::Isolate*, v8::Eternal<v8::FunctionTemplate>>> TemplateHolder<Type>::templates;

} // namespace detail

/**
 * Analogous to node::ObjectWrap. The JS object owns the C++ instance and deletes it once it's
 * collected.
 */
class ClassHandle {
	private:
		v8::Global<v8::Value> handle;

		static void WeakCallback(const v8::WeakCallbackInfo<ClassHandle>& info) {
			auto* that = info.GetParameter();
			that->handle.Reset();
			delete that; // NOLINT
		}

		/**
		 * Transfer ownership of this C++ pointer to the v8 handle lifetime.
		 */
		static void Wrap(std::unique_ptr<ClassHandle> ptr, v8::Local<v8::Object> handle) {
			handle->SetAlignedPointerInInternalField(0, ptr.get());
			ptr->handle.Reset(v8::Isolate::GetCurrent(), handle);
			ClassHandle* ptr_raw = ptr.release();
			ptr_raw->handle.SetWeak(ptr_raw, WeakCallback, v8::WeakCallbackType::kParameter);
		}

		/**
		 * It just throws when you call it; used for classes which are only made by the library
		 */
		static void PrivateConstructor(const v8::FunctionCallbackInfo<v8::Value>& /*info*/) {
			v8::Isolate::GetCurrent()->ThrowException(MakeError(ErrorKind::Configuration, "Constructor is private"));
		}

	protected:
		/**
		 * One entry on a class's prototype
		 */
		struct Member {
			enum class Kind { Method, Getter };
			const char* name;
			v8::FunctionCallback callback;
			Kind kind;
			int length;
		};

		static auto Method(const char* name, v8::FunctionCallback callback, int length = 0) -> Member {
			return {name, callback, Member::Kind::Method, length};
		}

		static auto Getter(const char* name, v8::FunctionCallback callback) -> Member {
			return {name, callback, Member::Kind::Getter, 0};
		}

		/**
		 * Sets up this object's FunctionTemplate inside the current isolate. Pass `nullptr` as the
		 * constructor for classes which can't be constructed from JS.
		 */
		static auto MakeClass(const char* class_name, v8::FunctionCallback constructor, std::initializer_list<Member> members) -> v8::Local<v8::FunctionTemplate> {
			v8::Isolate* isolate = v8::Isolate::GetCurrent();
			v8::Local<v8::String> name_handle = v8_symbol(class_name);
			v8::Local<v8::FunctionTemplate> tmpl = v8::FunctionTemplate::New(
				isolate, constructor == nullptr ? PrivateConstructor : constructor, name_handle);
			tmpl->SetClassName(name_handle);
			tmpl->InstanceTemplate()->SetInternalFieldCount(1);

			auto proto = tmpl->PrototypeTemplate();
			v8::Local<v8::Signature> sig = v8::Signature::New(isolate, tmpl);
			for (const auto& member : members) {
				v8::Local<v8::String> member_name = v8_symbol(member.name);
				auto function = v8::FunctionTemplate::New(isolate, member.callback, member_name, sig, member.length);
				if (member.kind == Member::Kind::Method) {
					proto->Set(member_name, function);
				} else {
					proto->SetAccessorProperty(member_name, function);
				}
			}
			return tmpl;
		}

		/**
		 * Entry point for `Type::Function(info)`, called with `this` unwrapped
		 */
		template <class Type, v8::Local<v8::Value> (Type::*Function)(const v8::FunctionCallbackInfo<v8::Value>&)>
		static void MemberEntry(const v8::FunctionCallbackInfo<v8::Value>& info) {
			detail::RunBarrier([&]() {
				auto* that = Unwrap<Type>(info.This());
				if (that == nullptr) {
					throw InputError("Illegal invocation");
				}
				info.GetReturnValue().Set((that->*Function)(info));
			});
		}

		/**
		 * Entry point for `new Type(...)`, which is built by `Type::New(info)`
		 */
		template <class Type>
		static void ConstructorEntry(const v8::FunctionCallbackInfo<v8::Value>& info) {
			detail::RunBarrier([&]() {
				if (!info.IsConstructCall()) {
					throw InputError("Class constructor cannot be invoked without 'new'");
				}
				Wrap(Type::New(info), info.This());
				info.GetReturnValue().Set(info.This());
			});
		}

	public:
		ClassHandle() = default;
		ClassHandle(const ClassHandle&) = delete;
		auto operator=(const ClassHandle&) -> ClassHandle& = delete;
		virtual ~ClassHandle() {
			if (!handle.IsEmpty()) {
				handle.ClearWeak();
				handle.Reset();
			}
		}

		/**
		 * Returns the FunctionTemplate for this isolate, generating it if needed.
		 */
		template <class Type>
		static auto GetFunctionTemplate() -> v8::Local<v8::FunctionTemplate> {
			auto* isolate = v8::Isolate::GetCurrent();
			{
				auto templates = detail::TemplateHolder<Type>::templates.read();
				auto it = templates->find(isolate);
				if (it != templates->end()) {
					return it->second.Get(isolate);
				}
			}
			auto tmpl = Type::Definition();
			detail::TemplateHolder<Type>::templates.write()->emplace(isolate, v8::Eternal<v8::FunctionTemplate>{isolate, tmpl});
			return tmpl;
		}

		/**
		 * Builds a new instance of T from scratch, used in factory functions.
		 */
		template <typename T, typename ...Args>
		static auto NewInstance(Args&&... args) -> v8::Local<v8::Object> {
			auto context = v8::Isolate::GetCurrent()->GetCurrentContext();
			// Skips the JS constructor, which is private for library-made classes
			v8::Local<v8::Object> instance = Unmaybe(GetFunctionTemplate<T>()->InstanceTemplate()->NewInstance(context));
			Wrap(std::make_unique<T>(std::forward<Args>(args)...), instance);
			return instance;
		}

		/**
		 * Pull out native pointer from v8 handle
		 */
		template <typename T>
		static auto Unwrap(v8::Local<v8::Object> handle) -> T* {
			if (handle.IsEmpty() || !ClassHandle::GetFunctionTemplate<T>()->HasInstance(handle)) {
				return nullptr;
			}
			if (handle->InternalFieldCount() < 1) {
				return nullptr;
			}
			return dynamic_cast<T*>(static_cast<ClassHandle*>(handle->GetAlignedPointerFromInternalField(0)));
		}
};

} // namespace jsbox
