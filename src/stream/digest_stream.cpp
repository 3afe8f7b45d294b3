#include "stream/digest_stream.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace streamcorpus {
namespace stream {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw std::runtime_error("Digest stream: Failed to create digest context");
    }
    init();
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  void init() {
    if (!EVP_DigestInit_ex(ctx, EVP_md5(), nullptr)) {
      throw std::runtime_error("Digest stream: Failed to initialize MD5 context");
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// MD5 DIGEST
//==============================================

Md5Digest::Md5Digest() : context_(std::make_unique<DigestContext>()) {}

Md5Digest::~Md5Digest() = default;

Md5Digest::Md5Digest(Md5Digest&&) noexcept = default;

Md5Digest& Md5Digest::operator=(Md5Digest&&) noexcept = default;

void Md5Digest::update(const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw std::runtime_error("Digest stream: Failed to update digest");
  }
}

std::string Md5Digest::hexdigest() const {
  // Finalize a copy so the running context keeps accepting bytes
  DigestContext snapshot;
  if (!EVP_MD_CTX_copy_ex(snapshot.get(), context_->get())) {
    throw std::runtime_error("Digest stream: Failed to copy digest context");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(snapshot.get(), hash, &hash_len)) {
    throw std::runtime_error("Digest stream: Failed to finalize digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

void Md5Digest::reset() {
  context_->init();
}

std::string Md5Digest::of(const Bytes& data) {
  Md5Digest digest;
  digest.update(data.data(), data.size());
  return digest.hexdigest();
}

//==============================================
// DIGESTING INPUT
//==============================================

DigestInputStream::DigestInputStream(std::shared_ptr<std::istream> input)
  : input_(std::move(input)) {
  if (!input_) {
    throw std::invalid_argument("Digest stream: null input stream");
  }
}

std::size_t DigestInputStream::read(void* data, std::size_t size) {
  input_->read(static_cast<char*>(data), static_cast<std::streamsize>(size));
  auto count = static_cast<std::size_t>(input_->gcount());

  if (input_->bad()) {
    BOOST_LOG_TRIVIAL(error) << "Digest stream: Failed to read from input stream";
    throw std::ios_base::failure("Digest stream: Failed to read from input stream");
  }

  digest_.update(data, count);
  bytes_read_ += count;
  return count;
}

bool DigestInputStream::at_end() {
  if (input_->bad()) {
    throw std::ios_base::failure("Digest stream: Input stream is in a bad state");
  }
  return input_->peek() == std::istream::traits_type::eof();
}

bool DigestInputStream::rewind() {
  input_->clear();
  input_->seekg(0, std::ios::beg);
  if (input_->fail()) {
    BOOST_LOG_TRIVIAL(debug) << "Digest stream: Input stream is not seekable";
    input_->clear();
    return false;
  }
  digest_.reset();
  bytes_read_ = 0;
  return true;
}

void DigestInputStream::close() {
  if (auto* file = dynamic_cast<std::ifstream*>(input_.get())) {
    file->close();
  } else if (auto* file = dynamic_cast<std::fstream*>(input_.get())) {
    file->close();
  }
}

//==============================================
// DIGESTING OUTPUT
//==============================================

DigestOutputStream::DigestOutputStream(std::shared_ptr<std::ostream> output)
  : output_(std::move(output)) {
  if (!output_) {
    throw std::invalid_argument("Digest stream: null output stream");
  }
}

void DigestOutputStream::write(const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  output_->write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
  if (!output_->good()) {
    BOOST_LOG_TRIVIAL(error) << "Digest stream: Failed to write " << size << " bytes to output stream";
    throw std::ios_base::failure("Digest stream: Failed to write to output stream");
  }
  digest_.update(data, size);
  bytes_written_ += size;
}

void DigestOutputStream::flush() {
  output_->flush();
  if (output_->bad()) {
    throw std::ios_base::failure("Digest stream: Failed to flush output stream");
  }
}

void DigestOutputStream::close() {
  flush();
  if (auto* file = dynamic_cast<std::ofstream*>(output_.get())) {
    file->close();
  } else if (auto* file = dynamic_cast<std::fstream*>(output_.get())) {
    file->close();
  }
}

//==============================================
// IN-MEMORY SOURCE
//==============================================

std::size_t BufferSource::read(void* data, std::size_t size) {
  std::size_t count = std::min(size, buffer_.size() - position_);
  if (count > 0) {
    std::memcpy(data, buffer_.data() + position_, count);
    position_ += count;
  }
  return count;
}

} // namespace stream
} // namespace streamcorpus
