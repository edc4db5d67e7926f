#include "image_loader.h"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

#include "raster_image.h"
#include "status.h"
#include "utils.h"

namespace booth_printer {

namespace {

/* Single-quotes a path for /bin/sh. */
std::string ShellQuote(const std::string &str)
{
    std::string quoted = "'";
    for (char c : str) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::expected<std::string, Status> Execute(const std::string &cmd)
{
    std::string result;
    char buffer[256];

    DB_PRINT("Running %s\n", cmd.c_str());
    FILE *f = popen(cmd.c_str(), "r");
    if (f == NULL) {
        return std::unexpected(Status(StatusCode::kInternalError,
                "Failed to run command"));
    }

    while (fgets(buffer, sizeof(buffer), f) != NULL) {
        result += buffer;
    }

    int ret = pclose(f);
    if (ret == -1 || !WIFEXITED(ret) || WEXITSTATUS(ret) != 0) {
        return std::unexpected(Status(StatusCode::kInvalidImage,
                "Command failed: " + cmd));
    }
    return result;
}

/* The output format is "${X_PIXELS} ${Y_PIXELS}". */
std::expected<std::pair<uint32_t, uint32_t>, Status>
    IdentifyDimensions(const std::string &quoted_first_frame)
{
    auto output = Execute("identify -format '%w %h' " + quoted_first_frame);
    if (!output.has_value()) {
        return std::unexpected(output.error());
    }

    std::istringstream ss(*output);
    uint32_t x_pixels = 0;
    uint32_t y_pixels = 0;
    if (!(ss >> x_pixels >> y_pixels) || x_pixels == 0 || y_pixels == 0) {
        return std::unexpected(Status(StatusCode::kInvalidImage,
                "Failed to correctly parse dimensions from '" + *output +
                "'"));
    }
    return std::make_pair(x_pixels, y_pixels);
}

/* Removes the file when it goes out of scope. */
class TempFile {
  public:
    TempFile() : path_("/tmp/booth-printer-XXXXXX") {}
    ~TempFile()
    {
        if (fd_ >= 0) {
            close(fd_);
            unlink(path_.c_str());
        }
    }

    Status Open()
    {
        fd_ = mkstemp(path_.data());
        if (fd_ < 0) {
            return Status(StatusCode::kInternalError,
                          std::string("mkstemp failed: ") + strerror(errno));
        }
        return Status(StatusCode::kStatusOk);
    }

    const std::string &path() { return path_; }

  private:
    std::string path_;
    int fd_ = -1;
};

};

std::expected<std::vector<uint8_t>, Status> ReadFile(const std::string &path)
{
    FILE *f = fopen(path.c_str(), "rb");
    if (f == NULL) {
        return std::unexpected(Status(StatusCode::kNotFoundError,
                                      "Failed to open file " + path));
    }

    /* Get the size of the file. */
    if (fseek(f, 0, SEEK_END)) {
        fclose(f);
        return std::unexpected(Status(StatusCode::kInternalError,
                                      "Failed to seek file"));
    }
    long file_size = ftell(f);
    if (file_size < 0) {
        fclose(f);
        return std::unexpected(Status(StatusCode::kInternalError,
                                      "Failed to get file size"));
    }
    /* Reset the seek pointer to the start. */
    rewind(f);

    std::vector<uint8_t> data(file_size);

    size_t total_read = 0;
    while (total_read != data.size()) {
        size_t num_read = fread(&data[total_read], /*size=*/sizeof(data[0]),
                                data.size() - total_read, f);
        if (num_read == 0) {
            fclose(f);
            return std::unexpected(Status(StatusCode::kInternalError,
                                          "Short read on " + path));
        }
        total_read += num_read;
    }

    fclose(f);

    return data;
}

std::expected<RasterImage, Status> LoadRawRgba(const std::string &path,
                                               uint32_t width)
{
    if (width == 0) {
        return std::unexpected(Status(StatusCode::kInvalidImage,
                                      "Raw image width must be non-zero"));
    }

    auto data = ReadFile(path);
    if (!data.has_value()) {
        return std::unexpected(data.error());
    }

    size_t row_size = static_cast<size_t>(width) *
                      RasterImage::kBytesPerPixel;
    if (data->empty() || data->size() % row_size != 0) {
        return std::unexpected(Status(StatusCode::kInvalidImage,
                path + " is not a whole number of " + std::to_string(width) +
                "-pixel RGBA rows"));
    }

    uint32_t height = data->size() / row_size;
    return RasterImage::Create(std::move(*data), width, height);
}

std::expected<RasterImage, Status> LoadImage(const std::string &path,
                                             bool rotate_landscape)
{
    /* Append [0] to the path so we only convert the first frame. */
    const std::string first_frame = ShellQuote(path + "[0]");

    auto dimensions = IdentifyDimensions(first_frame);
    if (!dimensions.has_value()) {
        Status status = dimensions.error();
        status.prepend_message(path + ": ");
        return std::unexpected(status);
    }
    auto [width, height] = *dimensions;

    bool rotate = rotate_landscape && width > height;
    if (rotate) {
        std::swap(width, height);
    }

    TempFile out;
    RETURN_UNEXPECTED_IF_ERROR(out.Open());

    std::string cmd = "convert " + first_frame +
                      (rotate ? " -rotate 90" : "") +
                      " -background white -flatten -depth 8 RGBA:" +
                      ShellQuote(out.path());
    auto output = Execute(cmd);
    if (!output.has_value()) {
        return std::unexpected(output.error());
    }

    auto data = ReadFile(out.path());
    if (!data.has_value()) {
        return std::unexpected(data.error());
    }

    auto image = RasterImage::Create(std::move(*data), width, height);
    if (!image.has_value()) {
        Status status = image.error();
        status.prepend_message(path + ": decoded size mismatch: ");
        return std::unexpected(status);
    }
    return image;
}

};
