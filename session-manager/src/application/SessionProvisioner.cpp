#include "application/SessionProvisioner.hpp"
#include "domain/Errors.hpp"
#include "domain/SessionDescriptor.hpp"

#include <algorithm>
#include <iostream>

namespace sandbox::application {

SessionProvisioner::SessionProvisioner(
    std::shared_ptr<CredentialProvisioner> credentials,
    std::shared_ptr<ports::output::ISessionRegistry> registry,
    std::shared_ptr<PortAllocator> allocator,
    std::shared_ptr<AllocationLedger> ledger,
    std::shared_ptr<ports::output::IDescriptorStore> descriptors,
    std::shared_ptr<ports::input::IRuntimeManager> runtime,
    std::shared_ptr<settings::RuntimeSettings> settings)
    : credentials_(std::move(credentials))
    , registry_(std::move(registry))
    , allocator_(std::move(allocator))
    , ledger_(std::move(ledger))
    , descriptors_(std::move(descriptors))
    , runtime_(std::move(runtime))
    , settings_(std::move(settings))
{}

ports::input::ProvisionResult SessionProvisioner::provision(bool startRuntime) {
    ports::input::ProvisionResult result;

    result.credentials = credentials_->generate();
    std::string sessionId = registry_->create(result.credentials.username, result.credentials.passwordHash);
    result.credentials.sessionId = sessionId;

    auto session = registry_->get(sessionId);
    if (!session) {
        result.errorKind = domain::ErrorKind::NOT_FOUND;
        result.message = "Session vanished right after registration: " + sessionId;
        return result;
    }
    result.expiresAt = session->expiresAt;

    std::string secretKey = credentials_->generateSecretKey();
    int maxAttempts = std::max(1, settings_->getProvisionMaxAttempts());

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        result.attempts = attempt;

        try {
            result.allocation = allocator_->allocate(sessionId);

            domain::SessionDescriptor descriptor;
            descriptor.sessionId = sessionId;
            descriptor.username = session->username;
            descriptor.passwordHash = session->passwordHash;
            descriptor.createdAt = session->createdAt;
            descriptor.expiresAt = session->expiresAt;
            descriptor.ttlHours = static_cast<int>(session->ttl.count());
            descriptor.active = session->active;
            descriptor.allocation = result.allocation;

            descriptors_->save(descriptor);
            descriptors_->writeEnvFile(descriptor, secretKey);
        } catch (const domain::ResourceConflictException& e) {
            std::cerr << "[SessionProvisioner] Allocation failed for " << sessionId << ": " << e.what() << std::endl;
            rollback(sessionId, false);
            result.errorKind = domain::ErrorKind::RESOURCE_CONFLICT;
            result.message = e.what();
            return result;
        } catch (const std::exception& e) {
            std::cerr << "[SessionProvisioner] Failed to write descriptor for " << sessionId << ": " << e.what() << std::endl;
            rollback(sessionId, false);
            result.errorKind = domain::ErrorKind::ORCHESTRATION_FAILURE;
            result.message = e.what();
            return result;
        }

        if (!startRuntime) {
            result.success = true;
            result.message = "Session provisioned";
            return result;
        }

        auto started = runtime_->start(sessionId);
        if (started.success) {
            result.success = true;
            result.runtimeStarted = true;
            result.message = "Session provisioned and runtime started";
            return result;
        }

        result.errorKind = started.errorKind;
        result.message = started.message;

        if (!started.isRetryable() || attempt == maxAttempts) {
            break;
        }

        std::cout << "[SessionProvisioner] Resource conflict on start of " << sessionId
                  << ", retrying with a fresh allocation (attempt " << attempt + 1
                  << "/" << maxAttempts << ")" << std::endl;

        auto stopped = runtime_->stop(sessionId);
        if (!stopped.success) {
            std::cerr << "[SessionProvisioner] Cleanup before retry failed for " << sessionId
                      << ", not retrying: " << stopped.message << std::endl;
            result.message += "; cleanup before retry failed: " + stopped.message;
            discard(sessionId, false);
            return result;
        }
        ledger_->release(sessionId);
    }

    std::cerr << "[SessionProvisioner] Giving up on " << sessionId << " after "
              << result.attempts << " attempt(s): " << result.message << std::endl;
    rollback(sessionId, true);
    return result;
}

std::vector<ports::input::ProvisionResult> SessionProvisioner::provisionBatch(int count, bool startRuntime) {
    std::vector<ports::input::ProvisionResult> results;
    for (int i = 0; i < count; ++i) {
        try {
            results.push_back(provision(startRuntime));
        } catch (const std::exception& e) {
            std::cerr << "[SessionProvisioner] Session " << (i + 1) << "/" << count
                      << " failed: " << e.what() << std::endl;
            ports::input::ProvisionResult failed;
            failed.errorKind = domain::ErrorKind::ORCHESTRATION_FAILURE;
            failed.message = e.what();
            results.push_back(failed);
        }
    }
    return results;
}

void SessionProvisioner::rollback(const std::string& sessionId, bool stopRuntime) {
    bool runtimeDown = true;
    if (stopRuntime) {
        auto stopped = runtime_->stop(sessionId);
        runtimeDown = stopped.success;
        if (!stopped.success) {
            std::cerr << "[SessionProvisioner] Rollback stop failed for " << sessionId
                      << ": " << stopped.message << std::endl;
        }
    }
    discard(sessionId, runtimeDown);
}

void SessionProvisioner::discard(const std::string& sessionId, bool runtimeDown) {
    try {
        descriptors_->remove(sessionId);
    } catch (const std::exception& e) {
        std::cerr << "[SessionProvisioner] Rollback could not remove descriptor of " << sessionId
                  << ": " << e.what() << std::endl;
    }

    registry_->remove(sessionId);

    if (runtimeDown && !descriptors_->exists(sessionId)) {
        ledger_->release(sessionId);
    } else {
        std::cerr << "[SessionProvisioner] Keeping reservations of " << sessionId
                  << ": runtime may still hold its ports" << std::endl;
    }
}

} // namespace sandbox::application
