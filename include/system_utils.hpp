#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX file descriptors.
 *
 * Closes the descriptor when the object goes out of scope.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Exclusive scratch directory removed with its contents on destruction.
 *
 * The directory is created with mkdtemp() below @p parent using @p label as
 * a readable prefix, so concurrent owners never share one.
 */
class TempWorkspace {
  public:
    /**
     * @throws std::filesystem::filesystem_error if the directory cannot be
     *         created.
     */
    TempWorkspace(const std::filesystem::path& parent, const std::string& label);
    ~TempWorkspace();

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

/**
 * @brief Look up an environment variable.
 *
 * @return The value, or `std::nullopt` when unset.
 */
std::optional<std::string> get_env(const std::string& name);

/**
 * @brief Expand a leading `~` or `~/` to the value of `$HOME`.
 */
std::filesystem::path expand_home(const std::string& path);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
