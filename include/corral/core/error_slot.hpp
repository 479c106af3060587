/**
 *
 *  @file error_slot.hpp
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
#ifndef CORRAL_ERROR_SLOT_HPP
#define CORRAL_ERROR_SLOT_HPP

#include <exception>
#include <mutex>
#include <optional>
#include <system_error>
#include <utility>

namespace corral::core
{

  /**
   * @brief Lock-guarded cell that keeps the first value written to it.
   *
   * Many threads may call try_set(); only the first one stores its value
   * and gets true back. Every later write is discarded. take() drains the
   * cell and is meant to be called once, after all writers finished.
   *
   * @tparam T Stored value type.
   */
  template <typename T>
  class first_write_slot
  {
  public:
    first_write_slot() = default;

    first_write_slot(const first_write_slot &) = delete;
    first_write_slot &operator=(const first_write_slot &) = delete;

    bool try_set(T v)
    {
      std::lock_guard<std::mutex> lock(m_);
      if (value_)
        return false;

      value_.emplace(std::move(v));
      return true;
    }

    std::optional<T> take()
    {
      std::lock_guard<std::mutex> lock(m_);
      std::optional<T> out = std::move(value_);
      value_.reset();
      return out;
    }

    bool has_value() const
    {
      std::lock_guard<std::mutex> lock(m_);
      return value_.has_value();
    }

  private:
    mutable std::mutex m_;
    std::optional<T> value_{};
  };

  // First runner failure among siblings.
  class error_slot : public first_write_slot<std::error_code>
  {
  public:
    // An empty code is success and never fills the slot.
    bool try_set(std::error_code ec)
    {
      if (!ec)
        return false;
      return first_write_slot<std::error_code>::try_set(ec);
    }
  };

  // First exception that escaped a runner thread.
  class fault_slot : public first_write_slot<std::exception_ptr>
  {
  public:
    bool try_set(std::exception_ptr ex)
    {
      if (!ex)
        return false;
      return first_write_slot<std::exception_ptr>::try_set(std::move(ex));
    }

    // Rethrows the stored fault, if any. The slot is empty afterwards.
    void rethrow_if_set()
    {
      if (auto ex = take())
        std::rethrow_exception(*ex);
    }
  };

} // namespace corral::core

#endif
