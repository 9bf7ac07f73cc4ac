#include "TestUtils.h"

using namespace std;

string joinLines(initializer_list<string> lines) {
  string result;
  for (const string& line : lines) {
    result += line;
    result += '\n';
  }
  return result;
}

vector<string> outputLines(const string& out) {
  vector<string> lines;
  istringstream in(out);
  string line;
  while (getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

string describeOps(const vector<Operation>& ops) {
  ostringstream oss;
  for (size_t i = 0; i < ops.size(); i++) {
    if (i > 0) oss << ", ";
    oss << ops[i];
  }
  return oss.str();
}
