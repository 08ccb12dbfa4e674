#include "SubprocessUtils.hpp"

namespace vc {
string SubprocessUtils::findExecutable(const string& name) {
  if (name.empty()) {
    return "";
  }
  if (name.find('/') != string::npos) {
    return isExecutable(name) ? name : "";
  }
  const char* pathEnv = getenv("PATH");
  if (!pathEnv) {
    return "";
  }
  for (const auto& dir : split(string(pathEnv), ':')) {
    if (dir.empty()) {
      continue;
    }
    string candidate = dir + "/" + name;
    if (isExecutable(candidate)) {
      VLOG(1) << "Found " << name << " at " << candidate;
      return candidate;
    }
  }
  return "";
}

bool SubprocessUtils::isExecutable(const string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return false;
  }
  return ::access(path.c_str(), X_OK) == 0;
}

int SubprocessUtils::runAndWait(const string& command,
                                const vector<string>& args) {
  vector<char*> argsArray;
  argsArray.push_back(strdup(command.c_str()));
  for (const auto& arg : args) {
    argsArray.push_back(strdup(arg.c_str()));
  }
  argsArray.push_back(NULL);

  LOG(INFO) << "Running " << command << " with " << args.size()
            << " argument(s)";
  pid_t pid = fork();
  if (pid == 0) {
    // child process
    execv(command.c_str(), &argsArray[0]);
    // Only reached when execv fails
    _exit(127);
  }

  for (auto arg : argsArray) {
    free(arg);
  }
  if (pid < 0) {
    auto localErrno = GetErrno();
    LOG(ERROR) << "Failed to fork: " << strerror(localErrno);
    throw std::runtime_error(string("Failed to fork: ") +
                             strerror(localErrno));
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      FATAL_FAIL(-1);
    }
  }
  if (WIFSIGNALED(status)) {
    LOG(INFO) << command << " killed by signal " << WTERMSIG(status);
    return 128 + WTERMSIG(status);
  }
  int exitCode = WEXITSTATUS(status);
  LOG(INFO) << command << " exited with " << exitCode;
  return exitCode;
}
}  // namespace vc
