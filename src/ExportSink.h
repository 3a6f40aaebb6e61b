#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Receives the encoded image when the user saves.
class ExportSink {
  public:
    virtual ~ExportSink() {}
    virtual bool exportImage(const std::string& filename, const std::vector<uint8_t>& data) = 0;
};

// Writes the image into a directory on disk.
class FileExportSink : public ExportSink {
  public:
    explicit FileExportSink(std::string directory = ".");
    bool exportImage(const std::string& filename, const std::vector<uint8_t>& data) override;
    const std::string& lastPath() const { return lastWritten; }

  private:
    std::string directory;
    std::string lastWritten;
};
