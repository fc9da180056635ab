#include "adapters/secondary/persistence/FileDescriptorStore.hpp"
#include "adapters/secondary/persistence/DescriptorJson.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace sandbox::adapters::secondary {

namespace fs = std::filesystem;

namespace {
const char* DESCRIPTOR_FILE = "session.json";
const char* ENV_FILE = ".env";
const char* LOCK_FILE = ".lock";

/**
 * @brief Эксклюзивный flock на файл, снимается в деструкторе
 */
class SessionFileLock {
public:
    explicit SessionFileLock(const fs::path& path)
        : fd_(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600))
    {
        if (fd_ < 0) {
            throw std::runtime_error("Cannot open lock file " + path.string());
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                ::close(fd_);
                throw std::runtime_error("Cannot lock " + path.string());
            }
        }
    }

    ~SessionFileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    SessionFileLock(const SessionFileLock&) = delete;
    SessionFileLock& operator=(const SessionFileLock&) = delete;

private:
    int fd_;
};

} // namespace

FileDescriptorStore::FileDescriptorStore(
    std::shared_ptr<settings::SessionSettings> sessionSettings,
    std::shared_ptr<settings::RuntimeSettings> runtimeSettings)
    : sessionSettings_(std::move(sessionSettings))
    , runtimeSettings_(std::move(runtimeSettings))
{
    std::cout << "[FileDescriptorStore] Sessions dir: " << sessionSettings_->getSessionsDir() << std::endl;
}

std::string FileDescriptorStore::sessionDir(const std::string& sessionId) const {
    return (fs::path(sessionSettings_->getSessionsDir()) / sessionId).string();
}

void FileDescriptorStore::save(const domain::SessionDescriptor& descriptor) {
    if (!isSafeSessionId(descriptor.sessionId)) {
        throw std::invalid_argument("Invalid session id: " + descriptor.sessionId);
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    writeDescriptor(descriptor);
}

void FileDescriptorStore::writeDescriptor(const domain::SessionDescriptor& descriptor) {
    fs::path dir = sessionDir(descriptor.sessionId);
    fs::create_directories(dir);
    writeAtomically((dir / DESCRIPTOR_FILE).string(), DescriptorJson::toJson(descriptor).dump(2));
}

std::optional<domain::SessionDescriptor> FileDescriptorStore::update(
    const std::string& sessionId,
    const Mutator& mutator)
{
    if (!isSafeSessionId(sessionId)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    fs::path dir = sessionDir(sessionId);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }

    SessionFileLock fileLock(dir / LOCK_FILE);
    auto descriptor = load(sessionId);
    if (!descriptor) {
        return std::nullopt;
    }
    if (mutator(*descriptor)) {
        writeDescriptor(*descriptor);
    }
    return descriptor;
}

std::optional<domain::SessionDescriptor> FileDescriptorStore::load(const std::string& sessionId) {
    if (!isSafeSessionId(sessionId)) {
        return std::nullopt;
    }

    fs::path file = fs::path(sessionDir(sessionId)) / DESCRIPTOR_FILE;
    std::ifstream in(file);
    if (!in) {
        return std::nullopt;
    }

    try {
        auto json = nlohmann::json::parse(in);
        return DescriptorJson::fromJson(json);
    } catch (const std::exception& e) {
        std::cerr << "[FileDescriptorStore] Unreadable descriptor " << file.string()
                  << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::vector<domain::SessionDescriptor> FileDescriptorStore::loadAll() {
    std::vector<domain::SessionDescriptor> result;

    fs::path root = sessionSettings_->getSessionsDir();
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return result;
    }

    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        auto descriptor = load(entry.path().filename().string());
        if (descriptor) {
            result.push_back(std::move(*descriptor));
        }
    }
    if (ec) {
        std::cerr << "[FileDescriptorStore] Failed to scan " << root.string()
                  << ": " << ec.message() << std::endl;
    }

    return result;
}

bool FileDescriptorStore::exists(const std::string& sessionId) {
    if (!isSafeSessionId(sessionId)) {
        return false;
    }
    std::error_code ec;
    return fs::exists(fs::path(sessionDir(sessionId)) / DESCRIPTOR_FILE, ec);
}

bool FileDescriptorStore::remove(const std::string& sessionId) {
    if (!isSafeSessionId(sessionId)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    fs::path dir = sessionDir(sessionId);
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return false;
    }
    fs::remove_all(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to remove " + dir.string() + ": " + ec.message());
    }
    return true;
}

void FileDescriptorStore::writeEnvFile(const domain::SessionDescriptor& descriptor, const std::string& secretKey) {
    if (!isSafeSessionId(descriptor.sessionId)) {
        throw std::invalid_argument("Invalid session id: " + descriptor.sessionId);
    }

    std::ostringstream env;
    env << "SESSION_ID=" << descriptor.sessionId << "\n"
        << "SESSION_TTL_HOURS=" << descriptor.ttlHours << "\n"
        << "SESSION_EXPIRES_AT=" << descriptor.expiresAt.toString() << "\n"
        << "BACKEND_PORT=" << descriptor.allocation.backendPort << "\n"
        << "FRONTEND_PORT=" << descriptor.allocation.frontendPort << "\n"
        << "SESSION_SUBNET=" << descriptor.allocation.subnet << "\n"
        << "SECRET_KEY=" << secretKey << "\n"
        << "COMPOSE_PROJECT_NAME=" << descriptor.allocation.containerName << "\n"
        << "CONTAINER_PREFIX=" << runtimeSettings_->getContainerPrefix() << "\n";

    std::lock_guard<std::mutex> lock(writeMutex_);
    fs::path dir = sessionDir(descriptor.sessionId);
    fs::create_directories(dir);
    writeAtomically((dir / ENV_FILE).string(), env.str());
    fs::permissions(dir / ENV_FILE, fs::perms::owner_read | fs::perms::owner_write);
}

std::optional<std::string> FileDescriptorStore::envFilePath(const std::string& sessionId) {
    if (!isSafeSessionId(sessionId)) {
        return std::nullopt;
    }
    fs::path file = fs::path(sessionDir(sessionId)) / ENV_FILE;
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return std::nullopt;
    }
    return fs::absolute(file, ec).string();
}

void FileDescriptorStore::writeAtomically(const std::string& path, const std::string& content) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + tmp + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed to write " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code cleanupEc;
        fs::remove(tmp, cleanupEc);
        throw std::runtime_error("Failed to replace " + path + ": " + ec.message());
    }
}

bool FileDescriptorStore::isSafeSessionId(const std::string& sessionId) {
    if (sessionId.empty() || sessionId == "." || sessionId == "..") {
        return false;
    }
    for (char c : sessionId) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                    || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

} // namespace sandbox::adapters::secondary
