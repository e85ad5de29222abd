#pragma once
#include "backend.hpp"

#include <cstddef>
#include <iterator>
#include <utility>
namespace NSNAME
{
// Gives the reference back exactly once, on reset() or destruction.
class AtomRef
{
  public:
    AtomRef() = default;
    AtomRef(Backend& backend, AtomHandle atom) : backend_(&backend), atom_(atom)
    {}
    ~AtomRef()
    {
        reset();
    }
    AtomRef(const AtomRef&) = delete;
    AtomRef& operator=(const AtomRef&) = delete;
    AtomRef(AtomRef&& other) noexcept :
        backend_(other.backend_), atom_(std::exchange(other.atom_, nullptr))
    {}
    AtomRef& operator=(AtomRef&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            backend_ = other.backend_;
            atom_ = std::exchange(other.atom_, nullptr);
        }
        return *this;
    }
    AtomHandle get() const
    {
        return atom_;
    }
    explicit operator bool() const
    {
        return atom_ != nullptr;
    }
    void reset()
    {
        if (atom_ != nullptr)
        {
            backend_->decRef(std::exchange(atom_, nullptr));
        }
    }

  private:
    Backend* backend_{nullptr};
    AtomHandle atom_{nullptr};
};

// An element is released when the iterator advances; decode it to keep it.
class AtomRange
{
  public:
    class iterator
    {
      public:
        using value_type = AtomHandle;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        iterator() = default;
        iterator(Backend& backend, AtomHandle list) :
            backend_(&backend), list_(list), cursor_(backend.iter(list))
        {
            fetch();
        }
        iterator(iterator&&) = default;
        iterator& operator=(iterator&&) = default;

        AtomHandle operator*() const
        {
            return value_.get();
        }
        iterator& operator++()
        {
            cursor_ = backend_->iterNext(list_, cursor_);
            value_.reset();
            fetch();
            return *this;
        }
        void operator++(int)
        {
            ++*this;
        }
        bool operator==(std::default_sentinel_t) const
        {
            return cursor_ == nullptr;
        }

      private:
        void fetch()
        {
            if (cursor_ != nullptr)
            {
                value_ = AtomRef(*backend_, backend_->iterValue(list_, cursor_));
            }
        }

        Backend* backend_{nullptr};
        AtomHandle list_{nullptr};
        CursorHandle cursor_{nullptr};
        AtomRef value_;
    };

    AtomRange(Backend& backend, AtomHandle list) : backend_(backend), list_(list)
    {}
    iterator begin() const
    {
        if (list_ == nullptr)
        {
            return iterator{};
        }
        return iterator(backend_, list_);
    }
    std::default_sentinel_t end() const
    {
        return std::default_sentinel;
    }

  private:
    Backend& backend_;
    AtomHandle list_;
};
} // namespace NSNAME
