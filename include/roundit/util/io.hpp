#ifndef ROUNDIT_UTIL_IO_H_
#define ROUNDIT_UTIL_IO_H_

#include <string>

#include "google/protobuf/message.h"

#include "roundit/common.hpp"
#include "roundit/proto/roundit.pb.h"

namespace roundit {

using ::google::protobuf::Message;

bool ReadProtoFromTextString(const string& text, Message* proto);

bool ReadProtoFromTextFile(const char* filename, Message* proto);

inline bool ReadProtoFromTextFile(const string& filename, Message* proto) {
  return ReadProtoFromTextFile(filename.c_str(), proto);
}

inline void ReadProtoFromTextFileOrDie(const char* filename, Message* proto) {
  CHECK(ReadProtoFromTextFile(filename, proto))
      << "Failed to parse text proto file " << filename;
}

inline void ReadProtoFromTextFileOrDie(const string& filename, Message* proto) {
  ReadProtoFromTextFileOrDie(filename.c_str(), proto);
}

void WriteProtoToTextFile(const Message& proto, const char* filename);
inline void WriteProtoToTextFile(const Message& proto, const string& filename) {
  WriteProtoToTextFile(proto, filename.c_str());
}

// Parses text such as "round: 5 accum: \"h\"" and validates the result.
void ReadRoundOptionsFromTextOrDie(const string& text, RoundOptions* options);

}  // namespace roundit

#endif   // ROUNDIT_UTIL_IO_H_
