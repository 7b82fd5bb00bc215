#pragma once
#ifndef TESTS_MOCKS_FAULTY_OBJECT_STORE_H
#define TESTS_MOCKS_FAULTY_OBJECT_STORE_H

#include "node/memory_object_store.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

// Wraps a MemoryObjectStore and injects per-address faults: failing writes,
// failing reads, slow writes and writes that land with a flipped byte.
class FaultyObjectStore : public chunkvault::ObjectStoreClient {
public:
    explicit FaultyObjectStore(std::shared_ptr<chunkvault::MemoryObjectStore> inner)
        : inner_(std::move(inner)) {}

    void failWrites(const std::string &address) { lock([&] { failWrites_.insert(address); }); }
    void failReads(const std::string &address) { lock([&] { failReads_.insert(address); }); }
    void tamperWrites(const std::string &address) { lock([&] { tamper_.insert(address); }); }
    void delayWrites(const std::string &address, std::chrono::milliseconds delay) {
        lock([&] { delays_[address] = delay; });
    }
    void heal(const std::string &address) {
        lock([&] {
            failWrites_.erase(address);
            failReads_.erase(address);
            tamper_.erase(address);
            delays_.erase(address);
        });
    }

    int putCalls() const { return putCalls_.load(); }

    void putObject(const std::string &address, const std::string &key,
                   const std::vector<std::byte> &data) override {
        ++putCalls_;
        bool fail = false;
        bool tamper = false;
        std::chrono::milliseconds delay{0};
        lock([&] {
            fail = failWrites_.count(address) > 0;
            tamper = tamper_.count(address) > 0;
            auto it = delays_.find(address);
            if (it != delays_.end()) delay = it->second;
        });
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (fail) throw chunkvault::ObjectStoreError("Injected write failure on " + address);
        if (tamper) {
            std::vector<std::byte> copy(data);
            if (copy.empty())
                copy.push_back(std::byte{0x01});
            else
                copy[0] ^= std::byte{0xFF};
            inner_->putObject(address, key, copy);
            return;
        }
        inner_->putObject(address, key, data);
    }

    std::optional<std::vector<std::byte>> getObject(const std::string &address,
                                                    const std::string &key) override {
        bool fail = false;
        lock([&] { fail = failReads_.count(address) > 0; });
        if (fail) throw chunkvault::ObjectStoreError("Injected read failure on " + address);
        return inner_->getObject(address, key);
    }

    bool deleteObject(const std::string &address, const std::string &key) override {
        return inner_->deleteObject(address, key);
    }

private:
    template <typename F> void lock(F &&f) {
        std::lock_guard<std::mutex> lg(mutex_);
        f();
    }

    std::shared_ptr<chunkvault::MemoryObjectStore> inner_;
    std::mutex mutex_;
    std::set<std::string> failWrites_;
    std::set<std::string> failReads_;
    std::set<std::string> tamper_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::atomic<int> putCalls_{0};
};

#endif // TESTS_MOCKS_FAULTY_OBJECT_STORE_H
