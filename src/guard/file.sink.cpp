#include "file.sink.hh"
#include "macros.hh"

#include <cstdio>
#include <random>

namespace fs = std::filesystem;

namespace {
std::string
temporary_suffix()
{
    static thread_local std::mt19937_64 gen{ std::random_device{}() };

    char buf[32];
    snprintf(buf,
             sizeof(buf),
             ".%016llx.tmp",
             static_cast<unsigned long long>(gen()));
    return buf;
}
} // namespace

xzarrguard::FileSink::FileSink(std::string_view filename)
  : path_{ filename }
  , tmp_path_{ path_.string() + temporary_suffix() }
  , file_(tmp_path_, std::ios::binary | std::ios::trunc)
{
    EXPECT_STATUS(file_.is_open(),
                  XzgStatusCode_IOError,
                  "Failed to open '",
                  tmp_path_.string(),
                  "' for writing");
}

xzarrguard::FileSink::~FileSink()
{
    if (published_) {
        return;
    }

    file_.close();
    std::error_code ec;
    if (fs::exists(tmp_path_, ec) && !fs::remove(tmp_path_, ec)) {
        LOG_WARNING("Failed to remove temporary file '",
                    tmp_path_.string(),
                    "': ",
                    ec.message());
    }
}

bool
xzarrguard::FileSink::write(size_t offset, std::span<const std::byte> data)
{
    const auto bytes_of_buf = data.size();
    if (data.data() == nullptr || bytes_of_buf == 0) {
        return true;
    }

    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(bytes_of_buf));
    return static_cast<bool>(file_);
}

bool
xzarrguard::FileSink::flush_()
{
    file_.flush();
    if (!file_) {
        LOG_ERROR("Failed to flush '", tmp_path_.string(), "'");
        return false;
    }
    file_.close();

    std::error_code ec;
    fs::rename(tmp_path_, path_, ec);
    if (ec) {
        LOG_ERROR("Failed to rename '",
                  tmp_path_.string(),
                  "' to '",
                  path_.string(),
                  "': ",
                  ec.message());
        return false;
    }

    published_ = true;
    return true;
}

std::unique_ptr<xzarrguard::Sink>
xzarrguard::make_file_sink(std::string_view file_path)
{
    if (file_path.starts_with("file://")) {
        file_path = file_path.substr(7);
    }

    EXPECT(!file_path.empty(), "File path must not be empty.");

    fs::path path(file_path);
    fs::path parent_path = path.parent_path();

    if (!parent_path.empty() && !fs::is_directory(parent_path)) {
        std::error_code ec;
        if (!fs::create_directories(parent_path, ec) &&
            !fs::is_directory(parent_path)) {
            LOG_ERROR("Failed to create directory '",
                      parent_path.string(),
                      "': ",
                      ec.message());
            return nullptr;
        }
    }

    return std::make_unique<FileSink>(file_path);
}

void
xzarrguard::write_file(std::string_view file_path,
                       std::span<const std::byte> data)
{
    auto sink = make_file_sink(file_path);
    EXPECT_STATUS(sink != nullptr,
                  XzgStatusCode_IOError,
                  "Failed to create '",
                  file_path,
                  "'");
    EXPECT_STATUS(sink->write(0, data),
                  XzgStatusCode_IOError,
                  "Failed to write '",
                  file_path,
                  "'");
    EXPECT_STATUS(finalize_sink(std::move(sink)),
                  XzgStatusCode_IOError,
                  "Failed to finalize '",
                  file_path,
                  "'");
}

void
xzarrguard::write_file(std::string_view file_path, std::string_view text)
{
    write_file(file_path,
               std::span<const std::byte>(
                 reinterpret_cast<const std::byte*>(text.data()), text.size()));
}
