#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace hxfer {

// Destination for a reconstructed file. Nothing appears under the final name
// until commit() succeeds.
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void open(const std::string& name) = 0;
    virtual void write(const uint8_t* data, size_t len) = 0;
    // Returns the committed path.
    virtual std::string commit() = 0;
    virtual void discard() noexcept = 0;
};

// Writes <dir>/.<name>.part.XXXXXX, then fsync and rename to <dir>/<name>.
class FileSink : public OutputSink {
public:
    explicit FileSink(std::string dir);
    ~FileSink() override;
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void open(const std::string& name) override;
    void write(const uint8_t* data, size_t len) override;
    std::string commit() override;
    void discard() noexcept override;

    const std::string& temp_path() const { return tmp_path_; }

private:
    std::string dir_;
    std::string tmp_path_;
    std::string final_path_;
    int fd_ = -1;
};

} // namespace hxfer
