#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>

#include <sys/types.h>

#include <json/json.h>

#include "tw/core/json_codec.h"
#include "tw/crypto/sha256.h"
#include "tw/error.h"
#include "tw/storage/io_util.h"

namespace tw::storage {

  inline constexpr mode_t kDefaultFilePermissions = 0640;

  struct PersistConfig {
    std::filesystem::path file; // empty: in-memory only
    mode_t file_permissions{kDefaultFilePermissions};
    std::chrono::milliseconds write_delay{0};
    // Receives every write failure, called without the document lock held.
    std::function<void(const Error&)> on_error;
  };

  // Debounce state; transitions happen under the document lock.
  enum class WriteState { kClean, kPending, kWriting };

  namespace detail {
    struct RenderedDocument {
      std::string text;
      crypto::Sha256Digest hash;
    };

    RenderedDocument RenderDocument(const Json::Value& value);

    // std::nullopt when the file is absent or empty. Throws
    // errors::state::kDocumentDecodeFailed on malformed content.
    std::optional<Json::Value> LoadDocument(const std::filesystem::path& path);

    [[noreturn]] void ThrowNoFile();
    [[noreturn]] void ThrowDecodeFailed(const std::filesystem::path& path, const Error& cause);
  } // namespace detail

  // Owns one document of type T, guarded by a reader/writer lock and mirrored
  // to a JSON file. T must be default constructible and have a
  // core::JsonCodec<T> specialisation.
  //
  // Usage: LockShared/UnlockShared around reads; Lock then Unlock or
  // UnlockAndWrite around mutations. With a nonzero write delay, the first
  // Unlock after a change arms a single deadline and later Unlocks within the
  // window coalesce into it. A write whose rendered content hashes the same as
  // the previous write touches nothing on disk.
  template <typename T>
  class Manager {
  public:
    // Loads |config.file| if present (decode failure throws) and writes the
    // normalised document back once.
    static std::unique_ptr<Manager> Open(PersistConfig config) {
      std::unique_ptr<Manager> manager(new Manager(std::move(config)));
      if (manager->has_file()) {
        std::unique_lock<std::shared_mutex> lock(manager->mutex_);
        manager->ReloadLocked();
        manager->WriteLocked();
      }
      if (manager->has_file() && manager->config_.write_delay.count() > 0) {
        manager->timer_thread_ = std::thread([raw = manager.get()] { raw->TimerLoop(); });
      }
      return manager;
    }

    ~Manager() {
      std::optional<Error> failure;
      {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        stopping_ = true;
        if (state_ == WriteState::kPending) {
          deadline_.reset();
          failure = TryWriteLocked();
        }
      }
      timer_cv_.notify_all();
      if (timer_thread_.joinable()) {
        timer_thread_.join();
      }
      if (failure) {
        Report(*failure);
      }
    }

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    void LockShared() { mutex_.lock_shared(); }
    void UnlockShared() { mutex_.unlock_shared(); }
    void Lock() { mutex_.lock(); }

    // Releases an exclusive lock. Without a write delay the document is
    // written before returning and failures are thrown as well as reported to
    // on_error; with one, a deadline is armed unless already pending.
    void Unlock() {
      if (!has_file()) {
        mutex_.unlock();
        return;
      }
      if (config_.write_delay.count() == 0) {
        UnlockAfterWrite();
        return;
      }
      if (state_ == WriteState::kClean) {
        state_ = WriteState::kPending;
        deadline_ = std::chrono::steady_clock::now() + config_.write_delay;
        timer_cv_.notify_all();
      }
      mutex_.unlock();
    }

    // Releases an exclusive lock, cancelling any pending deadline and writing
    // the document now.
    void UnlockAndWrite() {
      if (!has_file()) {
        mutex_.unlock();
        return;
      }
      if (deadline_) {
        deadline_.reset();
        timer_cv_.notify_all();
      }
      UnlockAfterWrite();
    }

    // Releases an exclusive lock without writing. The document counts as
    // changed and reaches disk with the next write or deadline.
    void UnlockDeferred() noexcept {
      if (has_file() && state_ == WriteState::kClean) {
        state_ = WriteState::kPending;
        if (config_.write_delay.count() > 0) {
          deadline_ = std::chrono::steady_clock::now() + config_.write_delay;
          timer_cv_.notify_all();
        }
      }
      mutex_.unlock();
    }

    // Writes the current document immediately. Throws kNoFile without a file.
    void Write() {
      if (!has_file()) {
        detail::ThrowNoFile();
      }
      Lock();
      UnlockAndWrite();
    }

    // Replaces the document with the file's content.
    void Reload() {
      if (!has_file()) {
        detail::ThrowNoFile();
      }
      std::unique_lock<std::shared_mutex> lock(mutex_);
      ReloadLocked();
    }

    // Access to the document; hold the appropriate lock.
    T& Doc() noexcept { return doc_; }
    const T& Doc() const noexcept { return doc_; }

    [[nodiscard]] bool has_file() const noexcept { return !config_.file.empty(); }
    [[nodiscard]] const std::filesystem::path& file() const noexcept { return config_.file; }
    [[nodiscard]] uint64_t writes_performed() const noexcept {
      return writes_performed_.load(std::memory_order_acquire);
    }
    [[nodiscard]] WriteState write_state() {
      std::shared_lock<std::shared_mutex> lock(mutex_);
      return state_;
    }

  private:
    explicit Manager(PersistConfig config) : config_(std::move(config)) {}

    void UnlockAfterWrite() {
      std::optional<Error> failure = TryWriteLocked();
      mutex_.unlock();
      if (failure) {
        Report(*failure);
        throw *failure;
      }
    }

    std::optional<Error> TryWriteLocked() {
      state_ = WriteState::kWriting;
      std::optional<Error> failure;
      try {
        WriteLocked();
      } catch (const Error& err) {
        failure = err;
      }
      state_ = WriteState::kClean;
      return failure;
    }

    void WriteLocked() {
      auto rendered = detail::RenderDocument(core::JsonCodec<T>::Encode(doc_));
      if (last_hash_ && *last_hash_ == rendered.hash) {
        return;
      }
      const auto* bytes = reinterpret_cast<const uint8_t*>(rendered.text.data());
      AtomicReplace(config_.file, std::span<const uint8_t>(bytes, rendered.text.size()),
                    config_.file_permissions);
      last_hash_ = rendered.hash;
      writes_performed_.fetch_add(1, std::memory_order_acq_rel);
    }

    void ReloadLocked() {
      auto loaded = detail::LoadDocument(config_.file);
      if (!loaded) {
        doc_ = T{};
        return;
      }
      try {
        doc_ = core::JsonCodec<T>::Decode(*loaded);
      } catch (const Error& err) {
        detail::ThrowDecodeFailed(config_.file, err);
      }
    }

    void TimerLoop() {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      for (;;) {
        timer_cv_.wait(lock, [&] { return stopping_ || deadline_.has_value(); });
        if (stopping_) {
          return;
        }
        const auto deadline = *deadline_;
        const bool cancelled = timer_cv_.wait_until(lock, deadline, [&] {
          return stopping_ || !deadline_.has_value() || *deadline_ != deadline;
        });
        if (cancelled) {
          continue;
        }
        deadline_.reset();
        std::optional<Error> failure = TryWriteLocked();
        if (failure) {
          lock.unlock();
          Report(*failure);
          lock.lock();
        }
      }
    }

    void Report(const Error& err) const {
      if (config_.on_error) {
        config_.on_error(err);
      }
    }

    const PersistConfig config_;
    T doc_{};

    std::shared_mutex mutex_;
    std::condition_variable_any timer_cv_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    WriteState state_{WriteState::kClean};
    bool stopping_{false};
    std::optional<crypto::Sha256Digest> last_hash_;
    std::atomic<uint64_t> writes_performed_{0};
    std::thread timer_thread_;
  };

  // Holds a shared lock on a Manager for the guard's scope.
  template <typename T>
  class SharedDocGuard {
  public:
    explicit SharedDocGuard(Manager<T>& manager) : manager_(manager) { manager_.LockShared(); }
    ~SharedDocGuard() { manager_.UnlockShared(); }

    SharedDocGuard(const SharedDocGuard&) = delete;
    SharedDocGuard& operator=(const SharedDocGuard&) = delete;

    const T& Doc() const noexcept { return std::as_const(manager_).Doc(); }

  private:
    Manager<T>& manager_;
  };

  // Holds an exclusive lock on a Manager. Unlock or UnlockAndWrite release it
  // with the Manager's write semantics; a guard left holding the lock (for
  // instance while an exception unwinds) releases it via UnlockDeferred.
  template <typename T>
  class ExclusiveDocGuard {
  public:
    explicit ExclusiveDocGuard(Manager<T>& manager) : manager_(&manager) { manager_->Lock(); }
    ~ExclusiveDocGuard() {
      if (manager_) {
        manager_->UnlockDeferred();
      }
    }

    ExclusiveDocGuard(const ExclusiveDocGuard&) = delete;
    ExclusiveDocGuard& operator=(const ExclusiveDocGuard&) = delete;

    T& Doc() noexcept { return manager_->Doc(); }

    void Unlock() { Release()->Unlock(); }
    void UnlockAndWrite() { Release()->UnlockAndWrite(); }

  private:
    Manager<T>* Release() noexcept { return std::exchange(manager_, nullptr); }

    Manager<T>* manager_;
  };

} // namespace tw::storage
