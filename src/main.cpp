#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Script/ScriptRunner.h"
#include "Utils/Debug.h"

using namespace std;

static string readAll(istream& in) {
  return string(istreambuf_iterator<char>(in), istreambuf_iterator<char>());
}

static string readScript(int argc, char* argv[]) {
  if (argc == 1) {
    return readAll(cin);
  }
  ifstream fin(argv[1], ios::binary);
  if (!fin) {
    throw runtime_error(string("Can't read ") + argv[1]);
  }
  return readAll(fin);
}

// Called on every exit path, failures included.
static void dumpDebug() {
  if constexpr (DEBUG_ENABLED) {
    cerr << take_debug_output();
  }
}

int main(int argc, char* argv[]) {
  if (argc > 2) {
    cerr << "usage: " << argv[0] << " [script-path]" << endl;
    return 1;
  }

  try {
    string input = readScript(argc, argv);
    RunStatus status = runScript(input, cout);
    dumpDebug();

    if (status == RunStatus::MalformedHeader) {
      cerr << "malformed script: first line must be the operation count" << endl;
      return 1;
    }
  } catch (const runtime_error& e) {
    cout.flush();
    dumpDebug();
    cerr << e.what() << endl;
    return 1;
  }

  return 0;
}
