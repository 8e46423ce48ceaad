#include "bench_common.hpp"

#include "chronicle/common/id.hpp"
#include "chronicle/common/time.hpp"
#include "chronicle/history/record.hpp"

void run_record_benchmark() {
  chronicle::history::MessageRecord message;
  message.record_id = chronicle::common::generate_id();
  message.session_id = "bench-session";
  message.timestamp = chronicle::common::now_timestamp();
  message.content = "a benchmark message with \"quotes\" and a\nnewline";
  message.metadata["source"] = "bench";
  const chronicle::history::HistoryRecord record(message);

  chronicle::bench::run_bench("record_encode", 5000,
                              [&] { (void)chronicle::history::encode_record_json(record); });

  const std::string line = chronicle::history::encode_record_json(record);
  chronicle::bench::run_bench("record_parse", 5000,
                              [&] { (void)chronicle::history::parse_record_json(line); });
}
