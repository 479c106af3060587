/**
 *
 *  @file channel.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 *
 */
#ifndef CORRAL_CHANNEL_HPP
#define CORRAL_CHANNEL_HPP

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <corral/core/error.hpp>

namespace corral::core
{
  template <typename T>
  class sender;

  template <typename T>
  class receiver;

  class selector;

  namespace detail
  {
    /**
     * @brief Wake-up cell shared by a selector and every channel it watches.
     */
    struct select_waiter
    {
      std::mutex m;
      std::condition_variable cv;
      bool notified{false};

      void notify()
      {
        {
          std::lock_guard<std::mutex> lock(m);
          notified = true;
        }
        cv.notify_one();
      }
    };

    /**
     * @brief Shared state behind a sender/receiver pair.
     *
     * The channel closes for receivers once the last sender is gone, and
     * for senders once the last receiver is gone. Capacity 0 makes a
     * rendezvous channel: send() returns only after the value was taken.
     */
    template <typename T>
    class channel_state
    {
    public:
      channel_state(std::size_t capacity, bool unbounded)
          : capacity_(capacity), unbounded_(unbounded)
      {
      }

      channel_state(const channel_state &) = delete;
      channel_state &operator=(const channel_state &) = delete;

      bool send(T &&v)
      {
        std::unique_lock<std::mutex> lock(m_);
        cv_send_.wait(lock, [&]()
                      { return receivers_ == 0 || has_room(); });

        if (receivers_ == 0)
          return false;

        q_.push_back(std::move(v));
        const std::uint64_t ticket = ++pushed_;
        notify_receivers();

        if (!is_rendezvous())
          return true;

        cv_send_.wait(lock, [&]()
                      { return popped_ >= ticket || receivers_ == 0; });
        return popped_ >= ticket;
      }

      bool try_send(T &&v)
      {
        std::lock_guard<std::mutex> lock(m_);
        if (receivers_ == 0 || !has_room())
          return false;

        // Nobody is waiting to take it, so a rendezvous cannot complete.
        if (is_rendezvous() && blocked_receivers_ == 0 && waiters_.empty())
          return false;

        q_.push_back(std::move(v));
        ++pushed_;
        notify_receivers();
        return true;
      }

      std::optional<T> recv()
      {
        std::unique_lock<std::mutex> lock(m_);
        ++blocked_receivers_;
        cv_recv_.wait(lock, [&]()
                      { return !q_.empty() || senders_ == 0; });
        --blocked_receivers_;

        if (q_.empty())
          return std::nullopt;

        return pop_locked();
      }

      std::optional<T> try_recv()
      {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty())
          return std::nullopt;
        return pop_locked();
      }

      // Ready means a value was taken or the channel is closed and drained.
      bool poll(std::optional<T> &out)
      {
        std::lock_guard<std::mutex> lock(m_);
        if (!q_.empty())
        {
          out = pop_locked();
          return true;
        }

        if (senders_ == 0)
        {
          out.reset();
          return true;
        }

        return false;
      }

      bool closed() const
      {
        std::lock_guard<std::mutex> lock(m_);
        return senders_ == 0 && q_.empty();
      }

      std::size_t size() const
      {
        std::lock_guard<std::mutex> lock(m_);
        return q_.size();
      }

      std::size_t capacity() const noexcept { return capacity_; }

      void add_waiter(select_waiter *w)
      {
        std::lock_guard<std::mutex> lock(m_);
        waiters_.push_back(w);
      }

      void remove_waiter(select_waiter *w)
      {
        std::lock_guard<std::mutex> lock(m_);
        waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), w), waiters_.end());
      }

      void add_sender()
      {
        std::lock_guard<std::mutex> lock(m_);
        ++senders_;
      }

      void release_sender()
      {
        std::lock_guard<std::mutex> lock(m_);
        if (--senders_ == 0)
        {
          cv_recv_.notify_all();
          for (auto *w : waiters_)
            w->notify();
        }
      }

      void add_receiver()
      {
        std::lock_guard<std::mutex> lock(m_);
        ++receivers_;
      }

      void release_receiver()
      {
        std::lock_guard<std::mutex> lock(m_);
        if (--receivers_ == 0)
        {
          q_.clear();
          cv_send_.notify_all();
        }
      }

    private:
      bool is_rendezvous() const noexcept { return !unbounded_ && capacity_ == 0; }

      bool has_room() const noexcept
      {
        if (unbounded_)
          return true;
        return q_.size() < std::max<std::size_t>(capacity_, 1);
      }

      T pop_locked()
      {
        T v = std::move(q_.front());
        q_.pop_front();
        ++popped_;
        cv_send_.notify_all();
        return v;
      }

      void notify_receivers()
      {
        cv_recv_.notify_one();
        for (auto *w : waiters_)
          w->notify();
      }

    private:
      mutable std::mutex m_;
      std::condition_variable cv_send_;
      std::condition_variable cv_recv_;
      std::deque<T> q_;

      const std::size_t capacity_;
      const bool unbounded_;

      std::size_t senders_{0};
      std::size_t receivers_{0};
      std::size_t blocked_receivers_{0};
      std::uint64_t pushed_{0};
      std::uint64_t popped_{0};

      std::vector<select_waiter *> waiters_;
    };
  } // namespace detail

  /**
   * @brief Sending half of a channel. Copies share the channel.
   */
  template <typename T>
  class sender
  {
  public:
    sender() = default;

    sender(const sender &o) : st_(o.st_)
    {
      if (st_)
        st_->add_sender();
    }

    sender(sender &&o) noexcept : st_(std::move(o.st_)) {}

    sender &operator=(sender o) noexcept
    {
      std::swap(st_, o.st_);
      return *this;
    }

    ~sender()
    {
      if (st_)
        st_->release_sender();
    }

    /**
     * @brief Blocking send.
     *
     * Waits while the channel is full (or, for a rendezvous channel, until
     * a receiver took the value).
     *
     * @return false if every receiver is gone.
     */
    bool send(T v) const
    {
      return st_ && st_->send(std::move(v));
    }

    /**
     * @brief Non-blocking send.
     *
     * @return false if the channel is full or every receiver is gone.
     */
    bool try_send(T v) const
    {
      return st_ && st_->try_send(std::move(v));
    }

    explicit operator bool() const noexcept { return static_cast<bool>(st_); }

  private:
    template <typename U>
    friend std::pair<sender<U>, receiver<U>> make_channel(std::size_t capacity);

    template <typename U>
    friend std::pair<sender<U>, receiver<U>> make_unbounded_channel();

    explicit sender(std::shared_ptr<detail::channel_state<T>> st)
        : st_(std::move(st))
    {
      st_->add_sender();
    }

    std::shared_ptr<detail::channel_state<T>> st_{};
  };

  /**
   * @brief Receiving half of a channel. Copies share the channel.
   */
  template <typename T>
  class receiver
  {
  public:
    receiver() = default;

    receiver(const receiver &o) : st_(o.st_)
    {
      if (st_)
        st_->add_receiver();
    }

    receiver(receiver &&o) noexcept : st_(std::move(o.st_)) {}

    receiver &operator=(receiver o) noexcept
    {
      std::swap(st_, o.st_);
      return *this;
    }

    ~receiver()
    {
      if (st_)
        st_->release_receiver();
    }

    /**
     * @brief Blocking receive.
     *
     * @return the next value, or std::nullopt once every sender is gone and
     *         nothing is left to read.
     */
    std::optional<T> recv() const
    {
      if (!st_)
        return std::nullopt;
      return st_->recv();
    }

    std::optional<T> try_recv() const
    {
      if (!st_)
        return std::nullopt;
      return st_->try_recv();
    }

    // True once every sender is gone and the buffer is drained.
    bool closed() const
    {
      return !st_ || st_->closed();
    }

    std::size_t size() const { return st_ ? st_->size() : 0; }

    explicit operator bool() const noexcept { return static_cast<bool>(st_); }

  private:
    friend class selector;

    template <typename U>
    friend std::pair<sender<U>, receiver<U>> make_channel(std::size_t capacity);

    template <typename U>
    friend std::pair<sender<U>, receiver<U>> make_unbounded_channel();

    explicit receiver(std::shared_ptr<detail::channel_state<T>> st)
        : st_(std::move(st))
    {
      st_->add_receiver();
    }

    std::shared_ptr<detail::channel_state<T>> st_{};
  };

  /**
   * @brief Create a bounded channel holding at most @p capacity values.
   *
   * A capacity of 0 creates a rendezvous channel.
   */
  template <typename T>
  std::pair<sender<T>, receiver<T>> make_channel(std::size_t capacity)
  {
    auto st = std::make_shared<detail::channel_state<T>>(capacity, false);
    return {sender<T>{st}, receiver<T>{st}};
  }

  // send() on an unbounded channel never blocks.
  template <typename T>
  std::pair<sender<T>, receiver<T>> make_unbounded_channel()
  {
    auto st = std::make_shared<detail::channel_state<T>>(0, true);
    return {sender<T>{st}, receiver<T>{st}};
  }

  /**
   * @brief Blocking multi-way receive.
   *
   * Each on() call registers one receiver with a handler taking
   * std::optional<T>. wait() sleeps until at least one case is ready, runs
   * exactly one handler and returns its index. A closed channel is ready and
   * hands std::nullopt to its handler. When several cases are ready at once
   * the one registered first wins.
   */
  class selector
  {
  public:
    selector() = default;

    selector(const selector &) = delete;
    selector &operator=(const selector &) = delete;

    template <typename T, typename Fn>
    selector &on(const receiver<T> &rx, Fn &&fn)
    {
      if (!rx.st_)
        throw std::system_error(make_error_code(errc::invalid_argument));

      cases_.push_back(std::unique_ptr<select_case>(
          new case_impl<T, std::decay_t<Fn>>(rx.st_, std::forward<Fn>(fn))));
      return *this;
    }

    std::size_t wait()
    {
      if (cases_.empty())
        throw std::system_error(make_error_code(errc::invalid_argument));

      detail::select_waiter waiter;
      attach_guard guard{cases_, &waiter};

      while (true)
      {
        {
          std::lock_guard<std::mutex> lock(waiter.m);
          waiter.notified = false;
        }

        for (std::size_t i = 0; i < cases_.size(); ++i)
        {
          if (cases_[i]->try_fire())
            return i;
        }

        std::unique_lock<std::mutex> lock(waiter.m);
        waiter.cv.wait(lock, [&]()
                       { return waiter.notified; });
      }
    }

    std::size_t size() const noexcept { return cases_.size(); }

  private:
    struct select_case
    {
      virtual ~select_case() = default;

      virtual void attach(detail::select_waiter *w) = 0;
      virtual void detach(detail::select_waiter *w) = 0;
      virtual bool try_fire() = 0;
    };

    template <typename T, typename Fn>
    struct case_impl final : select_case
    {
      std::shared_ptr<detail::channel_state<T>> st;
      Fn fn;

      template <typename F>
      case_impl(std::shared_ptr<detail::channel_state<T>> s, F &&f)
          : st(std::move(s)), fn(std::forward<F>(f))
      {
      }

      void attach(detail::select_waiter *w) override { st->add_waiter(w); }
      void detach(detail::select_waiter *w) override { st->remove_waiter(w); }

      bool try_fire() override
      {
        std::optional<T> out;
        if (!st->poll(out))
          return false;

        fn(std::move(out));
        return true;
      }
    };

    struct attach_guard
    {
      std::vector<std::unique_ptr<select_case>> &cases;
      detail::select_waiter *waiter;

      attach_guard(std::vector<std::unique_ptr<select_case>> &c, detail::select_waiter *w)
          : cases(c), waiter(w)
      {
        for (auto &sc : cases)
          sc->attach(waiter);
      }

      ~attach_guard()
      {
        for (auto &sc : cases)
          sc->detach(waiter);
      }

      attach_guard(const attach_guard &) = delete;
      attach_guard &operator=(const attach_guard &) = delete;
    };

    std::vector<std::unique_ptr<select_case>> cases_;
  };

} // namespace corral::core

#endif
