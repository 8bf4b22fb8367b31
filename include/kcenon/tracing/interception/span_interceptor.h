#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file span_interceptor.h
 * @brief Runs operations inside a span described by a traced_method
 *
 * @code
 * span_interceptor interceptor(tracer);
 *
 * traced_method method;
 * method.declaring_type = "shop::order_service";
 * method.function = "place_order";
 * method.parameters = {{0, "order.id"}};
 *
 * auto place_order = interceptor.wrap(method, [&](const std::string& id) {
 *     return repository.save(id);
 * });
 * place_order("o-1");   // recorded as "order_service.place_order"
 * @endcode
 *
 * For every invocation the interceptor starts a span (linked to the
 * producer when an argument is a trace_carrier with coordinates), writes
 * the static, parameter and code attributes in that order, makes the span
 * active while the operation runs, marks it ok or error, and ends it
 * exactly once. Exceptions thrown by the operation are recorded and
 * rethrown unchanged. Tracing failures never fail the operation.
 */

#include "../config/tracing_config.h"
#include "../context/span_scope.h"
#include "../interfaces/tracer_interface.h"
#include "../linking/span_link_builder.h"
#include "../linking/trace_carrier.h"
#include "operation_descriptor.h"
#include "parameter_binding.h"

#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace kcenon { namespace tracing {

namespace detail {

template <typename T>
const trace_carrier* as_carrier(const T& value) {
    using U = std::remove_cv_t<T>;

    if constexpr (std::is_base_of_v<trace_carrier, U>) {
        return &value;
    } else if constexpr (std::is_pointer_v<U>) {
        if constexpr (std::is_base_of_v<trace_carrier,
                                        std::remove_cv_t<std::remove_pointer_t<U>>>) {
            return value;
        } else {
            return nullptr;
        }
    } else if constexpr (is_smart_pointer<U>::value) {
        if constexpr (std::is_base_of_v<trace_carrier,
                                        std::remove_cv_t<typename U::element_type>>) {
            return value.get();
        } else {
            return nullptr;
        }
    } else if constexpr (is_optional<U>::value) {
        return value ? as_carrier(*value) : nullptr;
    } else {
        return nullptr;
    }
}

/**
 * @brief First argument that is a carrier holding both trace id and span id
 */
template <typename... Args>
const trace_carrier* find_carrier(const Args&... args) {
    const trace_carrier* found = nullptr;
    auto consider = [&found](const trace_carrier* candidate) {
        if (found == nullptr && candidate != nullptr && candidate->has_trace_context()) {
            found = candidate;
        }
    };
    (consider(as_carrier(args)), ...);
    return found;
}

} // namespace detail

template <typename Fn>
class traced_operation;

/**
 * @class span_interceptor
 * @brief Wraps callables so each call is recorded as a span
 *
 * Copies share the tracer. Safe to use from many threads at once; the
 * active span is tracked per thread.
 */
class span_interceptor {
public:
    explicit span_interceptor(std::shared_ptr<tracer_interface> tracer,
                              tracing_config config = {});

    /**
     * @brief Invoke fn(args...) inside a span described by the descriptor
     * @return Whatever fn returns, including references and void
     */
    template <typename Fn, typename... Args>
    std::invoke_result_t<Fn, Args...> invoke(const operation_descriptor& descriptor,
                                             Fn&& fn, Args&&... args) const {
        using return_type = std::invoke_result_t<Fn, Args...>;

        if (!config_.enabled) {
            return std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
        }

        const trace_carrier* carrier =
            config_.link_carried_context ? detail::find_carrier(args...) : nullptr;
        auto span = start(descriptor, carrier);
        if (!span) {
            return std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
        }

        end_guard guard(*this, span);
        annotate(*span, descriptor, std::index_sequence_for<Args...>{}, args...);

        span_scope scope(span);
        try {
            if constexpr (std::is_void_v<return_type>) {
                std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
                mark_ok(*span);
            } else {
                return_type value = std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
                mark_ok(*span);
                return std::forward<return_type>(value);
            }
        } catch (...) {
            record_failure(*span, std::current_exception());
            throw;
        }
    }

    /**
     * @brief Resolve the declaration once and bind it to a callable
     */
    template <typename Fn>
    traced_operation<std::decay_t<Fn>> wrap(const traced_method& method, Fn&& fn) const;

    const tracing_config& config() const { return config_; }
    const std::shared_ptr<tracer_interface>& tracer() const { return tracer_; }

private:
    /**
     * @brief Ends a span when the invocation leaves, however it leaves
     */
    class end_guard {
    public:
        end_guard(const span_interceptor& owner, std::shared_ptr<trace_span> span)
            : owner_(owner), span_(std::move(span)) {}
        ~end_guard() { owner_.finish(span_); }

        end_guard(const end_guard&) = delete;
        end_guard& operator=(const end_guard&) = delete;

    private:
        const span_interceptor& owner_;
        std::shared_ptr<trace_span> span_;
    };

    /**
     * @brief Start the span and write the static attributes
     * @return nullptr if no span could be started
     */
    std::shared_ptr<trace_span> start(const operation_descriptor& descriptor,
                                      const trace_carrier* carrier) const;

    /**
     * @brief Write static, parameter and code attributes in that order
     *
     * Each stage is isolated: a failure is logged, the remaining stages
     * still run and the call proceeds.
     */
    template <typename... Args, std::size_t... I>
    void annotate(trace_span& span, const operation_descriptor& descriptor,
                  std::index_sequence<I...>, const Args&... args) const {
        guarded(span, "static attributes", [&] { apply_static_attributes(span, descriptor); });
        guarded(span, "parameter attributes",
                [&] { (bind_at(span, descriptor, I, args), ...); });
        guarded(span, "code metadata", [&] { apply_code_metadata(span, descriptor); });
    }

    template <typename Step>
    static void guarded(const trace_span& span, const char* stage, Step&& step) {
        try {
            step();
        } catch (const std::exception& e) {
            report_annotation_failure(span, stage, e.what());
        } catch (...) {
            report_annotation_failure(span, stage, "unknown exception");
        }
    }

    template <typename T>
    static void bind_at(trace_span& span, const operation_descriptor& descriptor,
                        std::size_t position, const T& arg) {
        const auto* key = descriptor.parameter_key(position);
        if (key == nullptr) {
            return;
        }
        if constexpr (is_bindable<T>()) {
            bind_parameter(span, *key, arg);
        } else {
            report_unbindable(span, position, *key);
        }
    }

    static void apply_static_attributes(trace_span& span, const operation_descriptor& descriptor);
    void apply_code_metadata(trace_span& span, const operation_descriptor& descriptor) const;
    static void report_annotation_failure(const trace_span& span, const char* stage,
                                          const std::string& reason);
    static void report_unbindable(const trace_span& span, std::size_t position,
                                  const std::string& key);
    static void mark_ok(trace_span& span) noexcept;
    void record_failure(trace_span& span, std::exception_ptr failure) const noexcept;
    void finish(const std::shared_ptr<trace_span>& span) const noexcept;

    std::shared_ptr<tracer_interface> tracer_;
    tracing_config config_;
    span_link_builder links_;
};

/**
 * @class traced_operation
 * @brief A callable bound to a resolved descriptor
 */
template <typename Fn>
class traced_operation {
public:
    traced_operation(span_interceptor interceptor,
                     std::shared_ptr<const operation_descriptor> descriptor,
                     Fn fn)
        : interceptor_(std::move(interceptor))
        , descriptor_(std::move(descriptor))
        , fn_(std::move(fn)) {}

    template <typename... Args>
    std::invoke_result_t<Fn&, Args...> operator()(Args&&... args) {
        return interceptor_.invoke(*descriptor_, fn_, std::forward<Args>(args)...);
    }

    template <typename... Args>
    std::invoke_result_t<const Fn&, Args...> operator()(Args&&... args) const {
        return interceptor_.invoke(*descriptor_, fn_, std::forward<Args>(args)...);
    }

    const operation_descriptor& descriptor() const { return *descriptor_; }

private:
    span_interceptor interceptor_;
    std::shared_ptr<const operation_descriptor> descriptor_;
    Fn fn_;
};

template <typename Fn>
traced_operation<std::decay_t<Fn>> span_interceptor::wrap(const traced_method& method,
                                                          Fn&& fn) const {
    return traced_operation<std::decay_t<Fn>>(
        *this,
        std::make_shared<const operation_descriptor>(operation_descriptor::resolve(method)),
        std::forward<Fn>(fn));
}

} } // namespace kcenon::tracing
