#include <unistd.h>
#include <sys/stat.h>
#include <algorithm>
#include <atomic>
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>


#include "ipc.h"
#include "util_generic.h"
#include "exception.h"
#include "debug.h"

#define READ_END STDIN_FILENO
#define WRITE_END STDOUT_FILENO

// no deadline still needs some ceiling for select()
#define NO_DEADLINE_SECS    (SECS_PER_DAY)

using namespace std;

// numbers each execute() so stderr files from one label never collide
static atomic<unsigned long> executions(0);


/********************************************************************
 *
 * IPC_Base
 *
 *******************************************************************/

/* one read() once data is waiting; 0 means the other end closed.  a select()
   timeout or a failed read throws. */
ssize_t IPC_Base::ipcRead(void *data, size_t count) {
    int ready = simpleSelect(readFd, 0, timeoutSecs);

    if (ready == 0)
        throw ABException("timeout on read()");

    if (ready == -1)
        throw ABException(string("error on select() of read - ") + strerror(errno));

    ssize_t bytes;
    while ((bytes = read(readFd, data, count)) == -1 && errno == EINTR);

    if (bytes == -1)
        throw ABException(string("error on pipe read - ") + strerror(errno));

    return bytes;
}


/* read until the other end closes, giving up once the absolute deadline passes */
string IPC_Base::ipcReadAll(time_t deadline) {
    string result;
    ssize_t bytesRead;

    while (true) {
        if (deadline) {
            time_t remaining = deadline - time(NULL);

            if (remaining <= 0)
                throw ABException("deadline exceeded");

            timeoutSecs = (unsigned int)remaining;
        }
        else
            timeoutSecs = NO_DEADLINE_SECS;

        if ((bytesRead = ipcRead(rawBuf, sizeof(rawBuf))) <= 0)
            break;

        result.append(rawBuf, bytesRead);
    }

    return result;
}


// drain whatever the other end writes until it closes
void IPC_Base::readAndTrash() {
    while (ipcRead(rawBuf, sizeof(rawBuf)) > 0);
}


ssize_t IPC_Base::ipcWrite(const void *data, size_t count) {
    int ready = simpleSelect(0, writeFd, timeoutSecs);

    if (ready == 0)
        throw ABException("timeout on write()");

    if (ready == -1)
        throw ABException(string("error on select() of write - ") + strerror(errno));

    ssize_t written;
    size_t total = 0;

    while (total < count) {
        while ((written = write(writeFd, (const char*)data + total, count - total)) == -1 && errno == EINTR);

        if (written <= 0)
            throw ABException(string("error on pipe write - ") + strerror(errno));

        total += written;
    }

    return (ssize_t)total;
}


void IPC_Base::ipcClose() {
    if (readFd >= 0)
        close(readFd);

    if (writeFd >= 0)
        close(writeFd);

    readFd = writeFd = -1;
}


/********************************************************************
 *
 * PipeExec
 *
 *******************************************************************/

bool operator!=(const struct ProcDetail& A, const struct ProcDetail& B) {
    return !(A == B);
}


bool operator==(const struct ProcDetail& A, const struct ProcDetail& B) {
    return (A.command == B.command && A.childPID == B.childPID);
}


PipeExec::PipeExec(string command, unsigned int timeout) : IPC_Base(-1, -1, timeout) {
    origCommand = command;
    errorDir = "";

    // pipes within a quoted remote command belong to the remote shell
    vector<string> segments;
    string current;
    char quote = 0;

    for (auto c: command) {
        if (quote) {
            if (c == quote)
                quote = 0;
        }
        else
            if (c == '\'' || c == '"')
                quote = c;
            else
                if (c == '|') {
                    segments.push_back(current);
                    current = "";
                    continue;
                }

        current += c;
    }
    segments.push_back(current);

    for (auto &segment: segments)
        if (trimSpace(segment).length())
            procs.insert(procs.end(), procDetail(trimSpace(segment)));
}


/*******************************************************************************
 * pickupTheKids()
 *
 * Reap the procs we forked directly.  Only the first proc in the chain is our
 * child, the rest are its descendants, so that's the status that gets kept.
 * waitpid() on the specific pid leaves other PipeExec instances (possibly in
 * other threads) to reap their own children.
 *******************************************************************************/
void PipeExec::pickupTheKids() {
    for (auto procIt = procs.begin(); procIt != procs.end(); ++procIt) {
        if (procIt->childPID > 0 && !procIt->reaped) {
            int wstatus;
            pid_t pid;

            while ((pid = waitpid(procIt->childPID, &wstatus, 0)) == -1 && errno == EINTR);

            procIt->reaped = true;

            if (pid == procIt->childPID) {
                if (WIFEXITED(wstatus))
                    procIt->status = WEXITSTATUS(wstatus);
                else
                    if (WIFSIGNALED(wstatus))
                        procIt->status = 128 + WTERMSIG(wstatus);

                DEBUG(D_exec) DFMT("pid " + to_string(GLOBALS.pid) + " reaped child pid " + to_string(pid) + " status " + to_string(procIt->status));
            }
            else
                DEBUG(D_exec) DFMT("unable to reap child pid " + to_string(procIt->childPID) + errtext());
        }
    }
}


// each chain runs in its own process group so a deadline overrun takes out
// everything it started (rsync's ssh included)
void PipeExec::killTheKids() {
    for (auto &proc: procs)
        if (proc.childPID > 0 && !proc.reaped) {
            DEBUG(D_exec) DFMT("killing process group " << proc.childPID << " [" << origCommand << "]");
            kill(-proc.childPID, SIGKILL);
        }
}


int PipeExec::exitStatus() {
    pickupTheKids();
    return(procs.size() > 1 ? procs[1].status : 0);
}


PipeExec::~PipeExec() {
    closeAll();
    pickupTheKids();
    flushErrors();
}


void PipeExec::flushErrors() {
    if (errorDir.length() && exists(errorDir))
        rmrf(errorDir);
}


int PipeExec::closeAll() {
    int a = closeWrite();
    int b = closeRead();
    return(!(a == 0 && b == 0));
}


int PipeExec::closeRead() {
    int result = 0;

    if (readFd >= 0)
        result = close(readFd);

    readFd = -1;
    return result;
}


int PipeExec::closeWrite() {
    int result = 0;

    if (writeFd >= 0)
        result = close(writeFd);

    writeFd = -1;
    return result;
}


// runs in the forked child, so no logging (the log mutex may be held by another thread)
static void redirectStdError(const string &filename) {
    int errorFd = open(filename.c_str(), O_CREAT | O_WRONLY | O_TRUNC, S_IRUSR | S_IWUSR);
    if (errorFd >= 0) {
        DUP2(errorFd, 2);
        close(errorFd);
    }
}


/*******************************************************************************
 * execute(procName)
 *
 * Fork the chain of procs and return the pid of the first one.  procName
 * names the scratch directory their stderr files land in.  Throws ABException
 * if the pipes or the fork can't be set up.
 *******************************************************************************/
pid_t PipeExec::execute(string procName) {
    if (!procs.size())
        return 0;

    errorDir = slashConcat(TMP_OUTPUT_DIR, to_string(getpid()), procName.length() ? safeFilename(procName) : "anonymous") + "/";
    if (mkdirp(errorDir))
        throw ABException("unable to mkdir " + errorDir + errtext());

    string commandID = to_string(++executions);
    DEBUG(D_exec) DFMT(to_string(getpid()) + " preparing full command [" << origCommand << "]");

    /* One proc per pipe segment, preceded by a placeholder "head" entry that only
       owns the fds we talk to the chain through.

       Each fork() hands the loop to the child: the parent side of every fork
       except the first execs its own segment, while the child carries on to
       fork the next one.  The first fork's parent is us; it keeps the head
       pipes and returns.  The last proc writes its stdout into the head's read
       pipe.

       We may be one of several worker threads, so anything that allocates or
       takes a lock (tokenizing, building argv, naming the stderr files) is done
       before the first fork().  The pipes are close-on-exec so they never leak
       into another thread's children. */
    procs.insert(procs.begin(), procDetail("head"));

    vector<string> stderrFnames;
    for (auto procIt = procs.begin(); procIt != procs.end(); ++procIt) {
        string commandPrefix = procIt->command.substr(0, procIt->command.find(" "));
        stderrFnames.push_back(errorDir + commandID + ":" + to_string(distance(procs.begin(), procIt)) + "." + safeFilename(pathSplit(commandPrefix).file) + ".stderr");

        if (procIt == procs.begin())
            continue;

        procIt->args = commandTokens(procIt->command);
        if (procIt->args.empty())
            throw ABException("empty command in [" + origCommand + "]");

        for (auto &arg: procIt->args)
            procIt->argv.push_back(&arg[0]);
        procIt->argv.push_back(NULL);
    }

    for (auto procIt = procs.begin(); procIt != procs.end(); ++procIt) {
        auto index = distance(procs.begin(), procIt);
        bool original = procIt == procs.begin();

        if (procIt != procs.end() - 1) {  // if not last proc

            if ((original && pipe2(procIt->readfd, O_CLOEXEC)) || pipe2(procIt->writefd, O_CLOEXEC)) {
                if (!original)
                    _exit(127);

                string err = "unable to create pipes for [" + origCommand + "]" + errtext();
                for (auto fd: { procIt->readfd[0], procIt->readfd[1], procIt->writefd[0], procIt->writefd[1] })
                    if (fd >= 0)
                        close(fd);
                throw ABException(err);
            }

            pid_t pid = fork();
            if (pid < 0) {
                if (!original)
                    _exit(127);

                string err = "unable to fork for [" + origCommand + "]" + errtext();
                close(procIt->readfd[READ_END]);
                close(procIt->readfd[WRITE_END]);
                close(procIt->writefd[READ_END]);
                close(procIt->writefd[WRITE_END]);
                throw ABException(err);
            }

            if (pid) {
                (procIt+1)->childPID = pid;

                // a middle proc: wire stdin to the previous pipe, stdout to ours, then exec
                if (!original) {
                    redirectStdError(stderrFnames[index]);

                    // the pipe two back belongs to the proc before the previous one
                    if (procs.size() > 2 && *procIt != procs[1]) {
                        auto back2_it = procIt - 2;
                        close(back2_it->writefd[0]);
                        close(back2_it->writefd[1]);
                    }

                    auto backIt = procIt - 1;
                    close(procIt->writefd[READ_END]);
                    close(backIt->writefd[WRITE_END]);
                    DUP2(backIt->writefd[READ_END], READ_END);
                    DUP2(procIt->writefd[WRITE_END], WRITE_END);

                    varexec(procIt->argv);
                }

                // the caller: keep our ends of the head pipes
                setpgid(pid, pid);
                close(procIt->writefd[READ_END]);
                close(procIt->readfd[WRITE_END]);

                readFd = procs[0].readfd[READ_END];
                writeFd = procs[0].writefd[WRITE_END];

                DEBUG(D_exec) DFMT(to_string(getpid()) + " started [" << origCommand << "] as pid " << pid);
                return pid;
            }

            // the whole chain shares the first child's process group
            if (original)
                setpgid(0, 0);
        }
        else  {
            // the last proc's stdout goes back to the caller through the head pipe
            redirectStdError(stderrFnames[index]);

            auto backIt = procIt - 1;
            DUP2(backIt->writefd[READ_END], READ_END);
            close(procs[0].writefd[WRITE_END]);
            close(procs[0].readfd[READ_END]);
            DUP2(procs[0].readfd[WRITE_END], WRITE_END);

            varexec(procIt->argv);
        }

        // child side: becomes the parent of the next fork, reading the previous pipe
        if (*procIt != procs[0]) {
            close(procIt->writefd[WRITE_END]);
            DUP2(procIt->writefd[READ_END], READ_END);
        }
    }

    // only the original parent returns above; every other path has exec()ed
    _exit(127);
}


string PipeExec::errorOutput() {
    return (errorDir.length() && exists(errorDir) ? catdir(errorDir) : "");
}


/********************************************************************
 *
 * PipeRunner
 *
 *******************************************************************/

/*******************************************************************************
 * run(command, label, deadline)
 *
 * Execute one command to completion, collecting its stdout, stderr and exit
 * status.  A command still running at the deadline is killed and reported
 * as timedOut.  Spawn failures come back as status 127 rather than an
 * exception so per-host callers can treat them like any failed command.
 *******************************************************************************/
cmdResult PipeRunner::run(string command, string label, time_t deadline) {
    cmdResult result;

    DEBUG(D_exec) DFMT(label << ": " << command);

    try {
        PipeExec proc(command);
        proc.execute(label);
        proc.closeWrite();

        try {
            result.output = proc.ipcReadAll(deadline);
        }
        catch (ABException &e) {
            proc.killTheKids();
            result.timedOut = deadline && time(NULL) >= deadline;
            result.errors = e.detail();
        }

        result.status = proc.exitStatus();

        string errors = trimSpace(proc.errorOutput());
        if (errors.length())
            result.errors += (result.errors.length() ? "; " : "") + errors;
    }
    catch (ABException &e) {
        result.status = 127;
        result.errors = e.detail();
    }

    DEBUG(D_exec) DFMT(label << ": exit status " << result.status << (result.timedOut ? " (timed out)" : ""));
    return result;
}
