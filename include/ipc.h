
#ifndef IPC_H
#define IPC_H

#include <string>
#include <vector>
#include <time.h>

#define BUFFER_SIZE     (1024 * 64)


using namespace std;


/********************************************************************
 * IPC_Base
 * select()-bounded reads and writes over a pair of descriptors.
 * Failures and timeouts throw ABException.  PipeExec fills in the
 * descriptors from the processes it starts.
 *******************************************************************/
class IPC_Base {
protected:
    int readFd;
    int writeFd;
    unsigned int timeoutSecs;
    char rawBuf[BUFFER_SIZE];

public:
    /* structors */
    IPC_Base(int rFd, int wFd, unsigned int timeout = 120) : readFd(rFd), writeFd(wFd), timeoutSecs(timeout) {}
    virtual ~IPC_Base() { ipcClose(); }

    /* reads */
    ssize_t ipcRead(void *data, size_t count);
    string ipcReadAll(time_t deadline = 0);
    void readAndTrash();

    /* writes */
    ssize_t ipcWrite(const void *data, size_t count);

    /* administration */
    void ipcClose();
};


// one process of a PipeExec chain
typedef struct ProcDetail {
    int writefd[2];
    int readfd[2];
    string command;
    vector<string> args;
    vector<char*> argv;     // points into args, NULL terminated, ready for execvp()
    pid_t childPID;
    bool reaped;
    int status;

    ProcDetail(string cmd) : command(cmd), childPID(0), reaped(false), status(-1) {
        writefd[0] = writefd[1] = readfd[0] = readfd[1] = -1;
    }

    friend bool operator!=(const struct ProcDetail& A, const struct ProcDetail& B);
    friend bool operator==(const struct ProcDetail& A, const struct ProcDetail& B);

} procDetail;


/********************************************************************
 * PipeExec
 * Runs a command line without a shell.  '|' outside of quotes
 * splits it into a chain of processes, each one's stdout feeding
 * the next.  We write to the first and read from the last; each
 * one's stderr goes to a file under TMP_OUTPUT_DIR until the
 * PipeExec is destroyed.  The whole chain shares a process group.
 *
 * e.g.
 *
 * PipeExec p("ssh -nq host ls /data");
 * p.execute("host1");
 * string listing = p.ipcReadAll(time(NULL) + 60);
 * if (p.exitStatus())
 *     cerr << p.errorOutput() << endl;
 *
 * PipeExec p("sort | uniq -c");
 * p.execute("words");
 * p.ipcWrite(words.c_str(), words.length());
 * p.closeWrite();
 * cout << p.ipcReadAll(time(NULL) + 10);
 *******************************************************************/
class PipeExec : public IPC_Base {
    string origCommand;
    vector<procDetail> procs;
    string errorDir;

public:
    /* structors */
    PipeExec(string command, unsigned int timeout = 120);
    ~PipeExec();

    /* execution */
    pid_t execute(string procName = "");

    /* administration */
    string errorOutput();
    void flushErrors();
    int closeRead();
    int closeWrite();
    int closeAll();
    void pickupTheKids();
    void killTheKids();
    int exitStatus();
};


/********************************************************************
 * CommandRunner
 * The seam between the backup logic and the outside world: every
 * ssh, rsync and mkdir goes through run().  PipeRunner is the real
 * thing; tests substitute a runner that records the commands.
 *******************************************************************/
struct cmdResult {
    int status;         // exit status, 127 if the binary couldn't be run
    bool timedOut;      // the deadline passed and the command was killed
    string output;
    string errors;

    cmdResult() : status(-1), timedOut(false) {}
};


class CommandRunner {
public:
    virtual ~CommandRunner() {}

    /* run(command, label, deadline)
     * Execute command and wait for it.  label names the scratch directory for
     * its stderr; deadline is an absolute time (0 for none). */
    virtual cmdResult run(string command, string label, time_t deadline) = 0;
};


class PipeRunner : public CommandRunner {
public:
    cmdResult run(string command, string label, time_t deadline);
};

#endif
