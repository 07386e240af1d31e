// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <util/pidfile.h>

#include <util/logging.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace {

const char* const PID_FILENAME = "proximad.pid";
const char* const ENGINE_LOCK = "engine/LOCK";

/** 0 when absent, -1 when present but unparsable */
int ReadPid(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return 0;
    }
    long pid = -1;
    if (!(in >> pid) || pid < 0) {
        return -1;
    }
    return static_cast<int>(pid);
}

} // namespace

CPidFile::CPidFile(const std::string& datadir)
    : m_datadir(datadir), m_path((std::filesystem::path(datadir) / PID_FILENAME).string()) {
}

CPidFile::~CPidFile() {
    Release();
}

bool CPidFile::CreateExclusive() {
    int fd = open(m_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return false;
    }
    std::string text = std::to_string(static_cast<int>(getpid())) + "\n";
    bool ok = write(fd, text.data(), text.size()) == static_cast<ssize_t>(text.size());
    close(fd);
    if (!ok) {
        unlink(m_path.c_str());
    }
    return ok;
}

bool CPidFile::TryAcquire() {
    if (m_acquired) {
        return true;
    }

    // One retry: the first attempt may find a stale file to clear
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (CreateExclusive()) {
            m_acquired = true;
            LogPrintf(ENGINE, DEBUG, "Holding %s", m_path.c_str());
            return true;
        }
        if (errno != EEXIST) {
            LogPrintf(ENGINE, ERROR, "Cannot create %s: %s", m_path.c_str(), strerror(errno));
            return false;
        }
        if (!IsStale(m_path)) {
            LogPrintf(ENGINE, ERROR, "Data directory %s is in use by PID %d", m_datadir.c_str(), GetLockingPid());
            return false;
        }
        LogPrintf(ENGINE, WARN, "Replacing stale %s left by PID %d", PID_FILENAME, GetLockingPid());
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
        RemoveStaleLocks(m_datadir);
    }
    return false;
}

void CPidFile::Release() {
    if (!m_acquired) {
        return;
    }
    m_acquired = false;
    std::error_code ec;
    std::filesystem::remove(m_path, ec);
    if (ec) {
        LogPrintf(ENGINE, WARN, "Cannot remove %s: %s", m_path.c_str(), ec.message().c_str());
    }
}

int CPidFile::GetLockingPid() const {
    int pid = ReadPid(m_path);
    return pid > 0 ? pid : 0;
}

bool CPidFile::IsStale(const std::string& pidfile_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(pidfile_path, ec)) {
        return false;
    }
    int pid = ReadPid(pidfile_path);
    return pid <= 0 || !IsProcessRunning(pid);
}

bool CPidFile::IsProcessRunning(int pid) {
    // EPERM: alive, owned by someone else
    return kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

bool CPidFile::RemoveStaleLocks(const std::string& datadir) {
    std::filesystem::path lock = std::filesystem::path(datadir) / ENGINE_LOCK;
    std::error_code ec;
    if (!std::filesystem::remove(lock, ec)) {
        if (ec) {
            LogPrintf(STORAGE, ERROR, "Cannot remove %s: %s", lock.string().c_str(), ec.message().c_str());
        }
        return false;
    }
    LogPrintf(STORAGE, INFO, "Removed stale engine database lock");
    return true;
}
