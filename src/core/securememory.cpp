#include "core/securememory.hpp"
#include <openssl/crypto.h>
#include <algorithm>

namespace cipherledger::core {

void SecureMemory::wipe(void* ptr, size_t size) {
    if (ptr && size > 0) {
        OPENSSL_cleanse(ptr, size);
    }
}

template<typename T>
SecureMemory::SecureVector<T>::SecureVector(size_t size)
    : data_(new T[size]()), size_(size) {}

template<typename T>
SecureMemory::SecureVector<T>::~SecureVector() {
    clear();
}

template<typename T>
SecureMemory::SecureVector<T>::SecureVector(SecureVector&& other) noexcept
    : data_(std::move(other.data_)), size_(other.size_) {
    other.size_ = 0;
}

template<typename T>
SecureMemory::SecureVector<T>& SecureMemory::SecureVector<T>::operator=(SecureVector&& other) noexcept {
    if (this != &other) {
        clear();
        data_ = std::move(other.data_);
        size_ = other.size_;
        other.size_ = 0;
    }
    return *this;
}

template<typename T>
void SecureMemory::SecureVector<T>::clear() {
    if (data_) {
        SecureMemory::wipe(data_.get(), size_ * sizeof(T));
    }
    data_.reset();
    size_ = 0;
}

template class SecureMemory::SecureVector<uint8_t>;

} // namespace cipherledger::core
