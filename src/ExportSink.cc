#include "ExportSink.h"
#include <SDL2/SDL.h>
#include <utility>

FileExportSink::FileExportSink(std::string directory) : directory(std::move(directory)) {}

bool FileExportSink::exportImage(const std::string& filename, const std::vector<uint8_t>& data) {
    if (data.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Export: nothing to write for %s", filename.c_str());
        return false;
    }
    std::string path = directory.empty() ? filename : directory + "/" + filename;
    SDL_RWops* rw = SDL_RWFromFile(path.c_str(), "wb");
    if (!rw) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Export: cannot open %s: %s", path.c_str(), SDL_GetError());
        return false;
    }
    size_t written = SDL_RWwrite(rw, data.data(), 1, data.size());
    bool closed = SDL_RWclose(rw) == 0;
    if (written != data.size() || !closed) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Export: short write to %s: %s", path.c_str(), SDL_GetError());
        return false;
    }
    lastWritten = path;
    SDL_Log("Saved %s (%u bytes)", path.c_str(), (unsigned)data.size());
    return true;
}
