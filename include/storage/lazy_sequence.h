// include/storage/lazy_sequence.h
#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace mapstore {

/**
 * @brief Finite, restartable, pull-based sequence.
 *
 * Nothing is evaluated until iteration starts. Every begin() asks the
 * factory for a fresh cursor, so a sequence can be walked more than once;
 * each walk sees the source as of the moment that walk started.
 */
template<typename T>
class LazySequence {
public:
    using Cursor = std::function<std::optional<T>()>;
    using CursorFactory = std::function<Cursor()>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;
        explicit iterator(std::shared_ptr<Cursor> cursor) : cursor_(std::move(cursor)) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const {
            return !current_.has_value() && !other.current_.has_value();
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void advance() {
            current_ = (cursor_ && *cursor_) ? (*cursor_)() : std::nullopt;
            if (!current_) {
                cursor_.reset();
            }
        }

        std::shared_ptr<Cursor> cursor_;
        std::optional<T> current_;
    };

    explicit LazySequence(CursorFactory factory) : factory_(std::move(factory)) {}

    static LazySequence empty() {
        return LazySequence([]() -> Cursor { return []() -> std::optional<T> { return std::nullopt; }; });
    }

    static LazySequence fromVector(std::vector<T> items) {
        auto shared = std::make_shared<const std::vector<T>>(std::move(items));
        return LazySequence([shared]() -> Cursor {
            auto pos = std::make_shared<size_t>(0);
            return [shared, pos]() -> std::optional<T> {
                if (*pos >= shared->size()) return std::nullopt;
                return (*shared)[(*pos)++];
            };
        });
    }

    // Defers building the whole vector until the first element is pulled.
    static LazySequence deferred(std::function<std::vector<T>()> producer) {
        return LazySequence([producer]() -> Cursor {
            auto items = std::make_shared<std::vector<T>>();
            auto pos = std::make_shared<size_t>(0);
            auto loaded = std::make_shared<bool>(false);
            return [producer, items, pos, loaded]() -> std::optional<T> {
                if (!*loaded) {
                    *items = producer();
                    *loaded = true;
                }
                if (*pos >= items->size()) return std::nullopt;
                return std::move((*items)[(*pos)++]);
            };
        });
    }

    iterator begin() const { return iterator(std::make_shared<Cursor>(factory_())); }
    iterator end() const { return iterator(); }

    template<typename F>
    auto map(F func) const -> LazySequence<std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        CursorFactory source = factory_;
        return LazySequence<U>([source, func]() -> typename LazySequence<U>::Cursor {
            auto inner = std::make_shared<Cursor>(source());
            return [inner, func]() -> std::optional<U> {
                std::optional<T> next = (*inner)();
                if (!next) return std::nullopt;
                return func(*next);
            };
        });
    }

    LazySequence filter(std::function<bool(const T&)> predicate) const {
        CursorFactory source = factory_;
        return LazySequence([source, predicate]() -> Cursor {
            auto inner = std::make_shared<Cursor>(source());
            return [inner, predicate]() -> std::optional<T> {
                while (std::optional<T> next = (*inner)()) {
                    if (predicate(*next)) return next;
                }
                return std::nullopt;
            };
        });
    }

    LazySequence concat(const LazySequence& tail) const {
        CursorFactory head_source = factory_;
        CursorFactory tail_source = tail.factory_;
        return LazySequence([head_source, tail_source]() -> Cursor {
            auto head = std::make_shared<Cursor>(head_source());
            auto rest = std::make_shared<std::optional<Cursor>>();
            return [head, rest, tail_source]() -> std::optional<T> {
                if (!*rest) {
                    if (std::optional<T> next = (*head)()) return next;
                    *rest = tail_source();
                }
                return (**rest)();
            };
        });
    }

    std::optional<T> first() const {
        Cursor cursor = factory_();
        return cursor();
    }

    std::vector<T> toVector() const {
        std::vector<T> out;
        Cursor cursor = factory_();
        while (std::optional<T> next = cursor()) {
            out.push_back(std::move(*next));
        }
        return out;
    }

    size_t count() const {
        size_t n = 0;
        Cursor cursor = factory_();
        while (cursor()) {
            ++n;
        }
        return n;
    }

private:
    CursorFactory factory_;
};

} // namespace mapstore
