#include <fcntl.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>
#include <unistd.h>

#include <string>

#include "roundit/common.hpp"
#include "roundit/rounding/round_options.hpp"
#include "roundit/util/io.hpp"

namespace roundit {

using google::protobuf::io::FileInputStream;
using google::protobuf::io::FileOutputStream;

bool ReadProtoFromTextString(const string& text, Message* proto) {
  return google::protobuf::TextFormat::ParseFromString(text, proto);
}

bool ReadProtoFromTextFile(const char* filename, Message* proto) {
  int fd = open(filename, O_RDONLY);
  CHECK_NE(fd, -1) << "File not found: " << filename;
  FileInputStream* input = new FileInputStream(fd);
  bool success = google::protobuf::TextFormat::Parse(input, proto);
  delete input;
  close(fd);
  return success;
}

void WriteProtoToTextFile(const Message& proto, const char* filename) {
  int fd = open(filename, O_WRONLY | O_CREAT | O_TRUNC, 0644);
  CHECK_NE(fd, -1) << "Cannot open " << filename << " for writing";
  FileOutputStream* output = new FileOutputStream(fd);
  CHECK(google::protobuf::TextFormat::Print(proto, output));
  delete output;
  close(fd);
}

void ReadRoundOptionsFromTextOrDie(const string& text, RoundOptions* options) {
  CHECK(ReadProtoFromTextString(text, options))
      << "Failed to parse RoundOptions: " << text;
  CheckRoundOptions(*options);
}

}  // namespace roundit
