#pragma once

#include "util/result.hpp"

#include <string>

namespace updater {

// Owning file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    static Result OpenDirectory(const std::string& path, Fd& out);

    int Get() const;
    bool Valid() const;
    int Release();

    void Reset(int fd);
    void Close();
    // Close and report the error; a failed close after write may mean lost data.
    Result CloseChecked();

  private:
    int fd_{-1};
};

} // namespace updater
