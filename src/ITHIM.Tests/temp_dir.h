#pragma once

#include "pch.h"

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

class TempDir {
  public:
    TempDir() : rnd_{std::random_device()()} {
        path_ = std::filesystem::path{::testing::TempDir()} / "ithim" / random_string();
        if (!std::filesystem::create_directories(path_)) {
            throw std::runtime_error{"Could not create temp dir"};
        }

        path_ = std::filesystem::absolute(path_);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    ~TempDir() {
        if (std::filesystem::exists(path_)) {
            std::filesystem::remove_all(path_);
        }
    }

    std::string random_string() const { return std::to_string(rnd_()); }

    const std::filesystem::path &path() const { return path_; }

    std::filesystem::path write_file(const std::string &name, const std::string &contents) const {
        auto file_path = path_ / name;
        auto ofs = std::ofstream{file_path};
        ofs << contents;
        return file_path;
    }

  private:
    mutable std::mt19937 rnd_;
    std::filesystem::path path_;
};
