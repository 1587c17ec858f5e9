#ifndef SKULD_STORE_BACKEND_HPP
#define SKULD_STORE_BACKEND_HPP

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace Skuld::Store::Details {
    // Held for as long as the exclusive lock of one key must last.
    class KeyLock {
    public:
        virtual ~KeyLock() = default;
    };

    // Byte storage addressed by '/'-separated paths relative to the backend root.
    class StorageBackend {
    public:
        virtual ~StorageBackend() = default;

        [[nodiscard]] virtual std::string describe(const std::string& path) const = 0;
        [[nodiscard]] virtual bool exists(const std::string& path) const = 0;
        [[nodiscard]] virtual std::optional<std::string> read(const std::string& path) const = 0;
        // Readers observe either the previous content or the new one, never a partial write.
        virtual void write(const std::string& path, const std::string& bytes) = 0;
        virtual bool remove(const std::string& path) = 0;
        [[nodiscard]] virtual std::vector<std::string> list() const = 0;
        // Blocks until the exclusive lock of `directory` is acquired.
        [[nodiscard]] virtual std::unique_ptr<KeyLock> lock(const std::string& directory) = 0;
    };

    class FileLock final : public KeyLock {
    public:
        explicit FileLock(const std::filesystem::path& path) : path_(path)
        {
            descriptor_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
            if (descriptor_ < 0) {
                throw std::runtime_error("Failed to open lock file '" + path_.string() + "': " + std::strerror(errno));
            }
            int result = 0;
            do {
                result = ::flock(descriptor_, LOCK_EX);
            } while (result != 0 && errno == EINTR);
            if (result != 0) {
                const std::string reason = std::strerror(errno);
                ::close(descriptor_);
                throw std::runtime_error("Failed to lock '" + path_.string() + "': " + reason);
            }
        }

        FileLock(const FileLock&) = delete;
        FileLock& operator=(const FileLock&) = delete;

        ~FileLock() override
        {
            ::flock(descriptor_, LOCK_UN);
            ::close(descriptor_);
        }

    private:
        std::filesystem::path path_{};
        int descriptor_{-1};
    };

    class FilesystemBackend final : public StorageBackend {
    public:
        explicit FilesystemBackend(std::filesystem::path root) : root_(std::move(root))
        {
            if (root_.empty()) {
                throw std::invalid_argument("Storage location must not be empty.");
            }
            std::error_code error;
            std::filesystem::create_directories(root_, error);
            if (error || !std::filesystem::is_directory(root_)) {
                throw std::runtime_error("Failed to create storage location '" + root_.string() + "': "
                                         + (error ? error.message() : std::string("not a directory")));
            }
        }

        [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

        [[nodiscard]] std::string describe(const std::string& path) const override { return (root_ / path).string(); }

        [[nodiscard]] bool exists(const std::string& path) const override
        {
            return std::filesystem::is_regular_file(root_ / path);
        }

        [[nodiscard]] std::optional<std::string> read(const std::string& path) const override
        {
            const auto target = root_ / path;
            if (!std::filesystem::is_regular_file(target)) {
                return std::nullopt;
            }
            std::ifstream stream(target, std::ios::binary);
            if (!stream) {
                throw std::runtime_error("Failed to open '" + target.string() + "' for reading.");
            }
            return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        }

        void write(const std::string& path, const std::string& bytes) override
        {
            const auto target = root_ / path;
            std::filesystem::create_directories(target.parent_path());

            auto temporary = target;
            temporary += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(counter_.fetch_add(1));
            {
                std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
                if (!stream) {
                    throw std::runtime_error("Failed to open '" + temporary.string() + "' for writing.");
                }
                stream.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
                stream.flush();
                if (!stream) {
                    std::error_code ignored;
                    std::filesystem::remove(temporary, ignored);
                    throw std::runtime_error("Failed to write '" + temporary.string() + "'.");
                }
            }

            std::error_code error;
            std::filesystem::rename(temporary, target, error);
            if (error) {
                std::error_code ignored;
                std::filesystem::remove(temporary, ignored);
                throw std::runtime_error("Failed to move '" + temporary.string() + "' into place: " + error.message());
            }
        }

        bool remove(const std::string& path) override
        {
            std::error_code error;
            const auto removed = std::filesystem::remove(root_ / path, error);
            if (error) {
                throw std::runtime_error("Failed to remove '" + (root_ / path).string() + "': " + error.message());
            }
            return removed;
        }

        [[nodiscard]] std::vector<std::string> list() const override
        {
            std::vector<std::string> files;
            for (const auto& entry : std::filesystem::recursive_directory_iterator(root_)) {
                if (entry.is_regular_file()) {
                    files.push_back(std::filesystem::relative(entry.path(), root_).generic_string());
                }
            }
            std::sort(files.begin(), files.end());
            return files;
        }

        [[nodiscard]] std::unique_ptr<KeyLock> lock(const std::string& directory) override
        {
            const auto folder = root_ / directory;
            std::filesystem::create_directories(folder);
            return std::make_unique<FileLock>(folder / ".lock");
        }

    private:
        std::filesystem::path root_{};
        std::atomic<std::uint64_t> counter_{0};
    };

    // In-process backend, used by tests and by callers that never persist.
    class MemoryBackend final : public StorageBackend {
    public:
        [[nodiscard]] std::string describe(const std::string& path) const override { return "memory://" + path; }

        [[nodiscard]] bool exists(const std::string& path) const override
        {
            std::lock_guard<std::mutex> guard(mutex_);
            return files_.contains(path);
        }

        [[nodiscard]] std::optional<std::string> read(const std::string& path) const override
        {
            std::lock_guard<std::mutex> guard(mutex_);
            const auto found = files_.find(path);
            if (found == files_.end()) {
                return std::nullopt;
            }
            return found->second;
        }

        void write(const std::string& path, const std::string& bytes) override
        {
            std::lock_guard<std::mutex> guard(mutex_);
            files_[path] = bytes;
        }

        bool remove(const std::string& path) override
        {
            std::lock_guard<std::mutex> guard(mutex_);
            return files_.erase(path) > 0;
        }

        [[nodiscard]] std::vector<std::string> list() const override
        {
            std::lock_guard<std::mutex> guard(mutex_);
            std::vector<std::string> files;
            files.reserve(files_.size());
            for (const auto& entry : files_) {
                files.push_back(entry.first);
            }
            return files;
        }

        [[nodiscard]] std::unique_ptr<KeyLock> lock(const std::string& directory) override
        {
            std::shared_ptr<std::mutex> key_mutex;
            {
                std::lock_guard<std::mutex> guard(mutex_);
                auto& slot = locks_[directory];
                if (!slot) {
                    slot = std::make_shared<std::mutex>();
                }
                key_mutex = slot;
            }
            return std::make_unique<MutexLock>(std::move(key_mutex));
        }

    private:
        class MutexLock final : public KeyLock {
        public:
            explicit MutexLock(std::shared_ptr<std::mutex> mutex) : mutex_(std::move(mutex)), lock_(*mutex_) {}

        private:
            std::shared_ptr<std::mutex> mutex_;
            std::unique_lock<std::mutex> lock_;
        };

        mutable std::mutex mutex_{};
        std::map<std::string, std::string> files_{};
        std::map<std::string, std::shared_ptr<std::mutex>> locks_{};
    };
}

#endif // SKULD_STORE_BACKEND_HPP
