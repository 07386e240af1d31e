// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_UTIL_PIDFILE_H
#define PROXIMA_UTIL_PIDFILE_H

#include <string>

/**
 * CPidFile - one proximad per data directory
 *
 * The file is created exclusively, so two daemons racing for the same
 * directory cannot both win. A file left by a process that is no longer
 * running is stale: it is replaced, and the engine database LOCK the
 * crashed process left behind is removed with it.
 */
class CPidFile {
public:
    explicit CPidFile(const std::string& datadir);
    ~CPidFile();

    CPidFile(const CPidFile&) = delete;
    CPidFile& operator=(const CPidFile&) = delete;

    /** @return false if a live process holds the data directory */
    bool TryAcquire();
    void Release();

    bool IsAcquired() const { return m_acquired; }
    const std::string& GetPath() const { return m_path; }

    /** PID in the file, 0 if there is none */
    int GetLockingPid() const;

    static bool IsStale(const std::string& pidfile_path);
    static bool IsProcessRunning(int pid);
    static bool RemoveStaleLocks(const std::string& datadir);

private:
    /** O_EXCL create and write our pid */
    bool CreateExclusive();

    std::string m_datadir;
    std::string m_path;
    bool m_acquired{false};
};

#endif // PROXIMA_UTIL_PIDFILE_H
