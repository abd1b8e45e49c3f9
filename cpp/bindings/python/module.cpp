#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <string>
#include <stdexcept>
#include <vector>

#include "treehash/treehash.hpp"
#include "treehash/hash.hpp"

namespace py = pybind11;

static py::bytes digest_to_bytes(const treehash::Digest& d) {
  return py::bytes(reinterpret_cast<const char*>(d.bytes.data()), d.bytes.size());
}

static treehash::TreeConfig make_config(std::uint32_t threads,
                                        const std::optional<std::vector<std::uint32_t>>& iv) {
  treehash::TreeConfig cfg;
  cfg.threads = threads;
  if (iv.has_value()) {
    if (iv->size() != cfg.iv.size())
      throw std::invalid_argument("iv must contain exactly 8 words");
    for (std::size_t i = 0; i < cfg.iv.size(); ++i) cfg.iv[i] = (*iv)[i];
  }
  return cfg;
}

// camelCase keys: this dict is the HTTP response contract.
static py::dict trace_to_dict(const treehash::Trace& t) {
  py::list rounds;
  for (const auto& r : t.rounds) {
    py::dict d;
    d["round"] = r.round;
    d["inputHashOutputs"] = r.input_hash_outputs;
    d["computedNewIV"] = r.computed_new_iv;
    d["newBlocks"] = r.new_blocks;
    d["outputHashOutputs"] = r.output_hash_outputs;
    rounds.append(d);
  }

  py::dict out;
  out["originalMessage"] = t.original_message;
  out["padded"] = t.padded;
  out["blocks"] = t.blocks;
  out["initialHashOutputs"] = t.initial_hash_outputs;
  out["rounds"] = rounds;
  out["finalDigest"] = t.final_digest;
  return out;
}

static py::bytes digest_py(const py::bytes& data, std::uint32_t threads,
                           std::optional<std::vector<std::uint32_t>> iv) {
  std::string buf = data;
  const treehash::TreeConfig cfg = make_config(threads, iv);

  // Release the GIL for the heavy computation.
  treehash::Digest d;
  {
    py::gil_scoped_release nogil;
    d = treehash::digest(buf, cfg);
  }
  return digest_to_bytes(d);
}

static py::dict digest_with_trace_py(const py::bytes& data, std::uint32_t threads,
                                     std::optional<std::vector<std::uint32_t>> iv) {
  std::string buf = data;
  const treehash::TreeConfig cfg = make_config(threads, iv);

  treehash::DigestTrace res;
  {
    py::gil_scoped_release nogil;
    res = treehash::digest_with_trace(buf, cfg);
  }

  py::dict out;
  out["finalDigest"] = res.trace.final_digest;
  out["trace"] = trace_to_dict(res.trace);
  return out;
}

static std::string normal_hash_py(const py::bytes& data) {
  std::string buf = data;
  return treehash::to_hex(treehash::reference_sha256(buf));
}

// Response body of the hashing endpoint for a text request.
static py::dict hash_request_py(const std::string& input) {
  treehash::DigestTrace res;
  treehash::Digest normal;
  {
    py::gil_scoped_release nogil;
    res = treehash::digest_with_trace(input);
    normal = treehash::reference_sha256(input);
  }

  py::dict out;
  out["finalDigest"] = res.trace.final_digest;
  out["trace"] = trace_to_dict(res.trace);
  out["normalHash"] = treehash::to_hex(normal);
  return out;
}

PYBIND11_MODULE(treehash, m) {
  m.doc() = "Tree-reduced SHA-256 digest core (pybind11)";
  m.attr("__version__") = treehash::TREEHASH_VERSION;

  m.def("digest", &digest_py,
        py::arg("data"),
        py::arg("threads") = 0,                // 0 => hardware concurrency
        py::arg("iv") = py::none(),
        R"pbdoc(
Compute the 32-byte tree-reduced digest of `data`.

Args:
  data (bytes): message.
  threads (int): worker threads per compression batch; 0 for auto, 1 for inline.
  iv (list[int]): optional 8-word initial chaining value (default: SHA-256 H0).
)pbdoc");

  m.def("digest_with_trace", &digest_with_trace_py,
        py::arg("data"), py::arg("threads") = 0, py::arg("iv") = py::none(),
        R"pbdoc(Returns dict { finalDigest, trace } with every stage hex-encoded.)pbdoc");

  m.def("normal_hash", &normal_hash_py, py::arg("data"),
        R"pbdoc(Standard SHA-256 of `data` as hex, for comparison.)pbdoc");

  m.def("hash_request", &hash_request_py, py::arg("input"),
        R"pbdoc(
Hash the UTF-8 text `input` with the standard IV.

Returns:
  dict { finalDigest, trace, normalHash }.
)pbdoc");
}
