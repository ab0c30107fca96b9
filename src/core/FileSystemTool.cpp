#include "FileSystemTool.hpp"

#include <iostream>
#include <system_error>

namespace PhotoCull
{

// === FSETool Implementation ===

std::string FSETool::toAbsolutePath(const std::string& path) {
    try {
        return fs::absolute(path).string();
    } catch (const fs::filesystem_error&) {
        return path;
    }
}

void FSETool::createDirectory(const fs::path& dirpath) {
    std::error_code ec;
    if (dirpath.empty() || fs::is_directory(dirpath, ec)) return;
    try {
        fs::create_directories(dirpath);
    } catch (const fs::filesystem_error& e) {
        throw IOFailure("could not create directory '" + dirpath.string() + "': " + e.what());
    }
}

bool FSETool::hasSupportedExtension(const fs::path& path) {
    std::string ext = to_lower(path.extension().string());
    return std::find(SUPPORTED_IMG_FORMATS.begin(), SUPPORTED_IMG_FORMATS.end(), ext) != SUPPORTED_IMG_FORMATS.end();
}

namespace {

void collectIfImage(const fs::directory_entry& entry, std::vector<std::string>& images) {
    // Dangling or looping links report an error here and are skipped
    std::error_code ec;
    if (entry.is_regular_file(ec) && FSETool::hasSupportedExtension(entry.path())) {
        images.push_back(entry.path().string());
    }
}

} // namespace

std::vector<std::string> FSETool::getImageFiles(const fs::path& directory, bool recursive) {
    std::vector<std::string> images;
    std::string dir_abs = toAbsolutePath(directory.string());
    const auto options = fs::directory_options::skip_permission_denied;
    std::error_code ec;

    if (recursive) {
        fs::recursive_directory_iterator it(dir_abs, options, ec), end;
        if (ec) {
            std::cerr << "ERROR: could not scan '" << dir_abs << "': " << ec.message() << std::endl;
            return images;
        }
        while (it != end) {
            collectIfImage(*it, images);
            it.increment(ec);
            if (!ec) continue;

            std::cerr << "Warning: skipping unreadable entry under '" << dir_abs << "': " << ec.message() << std::endl;
            if (it == end) break;
            // Step past the directory that could not be opened
            it.disable_recursion_pending();
            it.increment(ec);
            if (ec) {
                std::cerr << "ERROR: could not continue scanning '" << dir_abs << "': " << ec.message() << std::endl;
                break;
            }
        }
    } else {
        fs::directory_iterator it(dir_abs, options, ec), end;
        if (ec) {
            std::cerr << "ERROR: could not scan '" << dir_abs << "': " << ec.message() << std::endl;
            return images;
        }
        for (; it != end; it.increment(ec)) {
            collectIfImage(*it, images);
        }
        if (ec) {
            std::cerr << "ERROR: could not finish scanning '" << dir_abs << "': " << ec.message() << std::endl;
        }
    }

    std::sort(images.begin(), images.end());
    return images;
}

fs::path FSETool::relativeTo(const fs::path& file, const fs::path& root) {
    fs::path rel = fs::absolute(file).lexically_normal()
                       .lexically_relative(fs::absolute(root).lexically_normal());
    if (rel.empty() || *rel.begin() == "..") {
        return file.filename();
    }
    return rel;
}

// === TransferAction ===

TransferAction parseTransferAction(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "report") return TransferAction::Report;
    if (lower == "copy") return TransferAction::Copy;
    if (lower == "move") return TransferAction::Move;
    throw ConfigurationError("unknown action '" + name + "' (expected report, copy or move)");
}

std::string toString(TransferAction action) {
    switch (action) {
        case TransferAction::Copy: return "copy";
        case TransferAction::Move: return "move";
        case TransferAction::Report: break;
    }
    return "report";
}

// === FileTransfer Implementation ===

void FileTransfer::moveFile(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;

    // rename() cannot cross filesystems: fall back to copy + remove
    if (ec == std::errc::cross_device_link) {
        fs::copy_file(from, to, fs::copy_options::overwrite_existing);
        fs::remove(from);
        return;
    }
    throw fs::filesystem_error("move failed", from, to, ec);
}

int FileTransfer::transfer(const std::vector<std::string>& files,
                           const fs::path& sourceRoot,
                           const fs::path& destRoot,
                           TransferAction action)
{
    if (action == TransferAction::Report) return 0;

    FSETool::createDirectory(destRoot);

    int transferred = 0;
    for (const auto& file : files) {
        fs::path dest = destRoot / FSETool::relativeTo(file, sourceRoot);
        FSETool::createDirectory(dest.parent_path());

        try {
            if (action == TransferAction::Copy) {
                fs::copy_file(file, dest, fs::copy_options::overwrite_existing);
            } else {
                moveFile(file, dest);
            }
        } catch (const fs::filesystem_error& e) {
            throw IOFailure("could not " + toString(action) + " '" + file + "' to '" +
                            dest.string() + "': " + e.what());
        }
        transferred++;
    }
    return transferred;
}

} // namespace PhotoCull
