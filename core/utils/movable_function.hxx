/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024-Present The devdns Authors
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace devdns::core::utils
{
/**
 * std::function that also accepts move-only callables, e.g. lambdas capturing a unique_ptr or
 * another movable_function. The wrapper itself can only be moved.
 *
 * Handlers are created and invoked on the io_context thread, so the shared target is not guarded.
 */
template<typename Signature>
class movable_function : public std::function<Signature>
{
  template<typename Functor>
  struct shared_target {
    std::shared_ptr<Functor> fn;

    template<typename... Args>
    auto operator()(Args&&... args)
    {
      return (*fn)(std::forward<Args>(args)...);
    }
  };

  template<typename Functor>
  static auto wrap(Functor&& f)
  {
    using target_type = std::decay_t<Functor>;
    if constexpr (std::is_copy_constructible_v<target_type>) {
      return target_type(std::forward<Functor>(f));
    } else {
      return shared_target<target_type>{ std::make_shared<target_type>(std::forward<Functor>(f)) };
    }
  }

  template<typename Functor>
  using enable_if_callable =
    std::enable_if_t<!std::is_same_v<std::decay_t<Functor>, movable_function> &&
                     !std::is_same_v<std::decay_t<Functor>, std::nullptr_t>>;

  using base = std::function<Signature>;

public:
  movable_function() noexcept = default;
  movable_function(const movable_function&) = delete;
  movable_function(std::nullptr_t) noexcept
    : base(nullptr)
  {
  }

  template<typename Functor, typename = enable_if_callable<Functor>>
  movable_function(Functor&& f)
    : base(wrap(std::forward<Functor>(f)))
  {
  }

  movable_function(movable_function&& other) noexcept
    : base(std::move(static_cast<base&&>(other)))
  {
    other = nullptr;
  }

  ~movable_function() = default;

  auto operator=(const movable_function&) -> movable_function& = delete;

  auto operator=(movable_function&& other) noexcept -> movable_function&
  {
    base::operator=(std::move(static_cast<base&&>(other)));
    other = nullptr;
    return *this;
  }

  auto operator=(std::nullptr_t /* other */) noexcept -> movable_function&
  {
    base::operator=(nullptr);
    return *this;
  }

  template<typename Functor, typename = enable_if_callable<Functor>>
  auto operator=(Functor&& f) -> movable_function&
  {
    base::operator=(wrap(std::forward<Functor>(f)));
    return *this;
  }

  using base::operator bool;
  using base::operator();
};
} // namespace devdns::core::utils
