#include "parcel/core/errors.hpp"

namespace parcel::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::SourceNotFound: return "SourceNotFound";
            case StatusCode::SourceChanged: return "SourceChanged";
            case StatusCode::InsufficientSpace: return "InsufficientSpace";
            case StatusCode::ChunkSizeMismatch: return "ChunkSizeMismatch";
            case StatusCode::ChunkIndexOutOfRange: return "ChunkIndexOutOfRange";
            case StatusCode::ChunkWriteFailed: return "ChunkWriteFailed";
            case StatusCode::InventoryNotFound: return "InventoryNotFound";
            case StatusCode::InventoryCorrupt: return "InventoryCorrupt";
            case StatusCode::ReconstructionBlocked: return "ReconstructionBlocked";
            case StatusCode::HashVerificationFailed: return "HashVerificationFailed";
            case StatusCode::SizeMismatch: return "SizeMismatch";
            case StatusCode::OutputExists: return "OutputExists";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Hash: return "Hash";
            case StatusDomain::Inventory: return "Inventory";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Chunker: return "Chunker";
            case StatusDomain::Rebuild: return "Rebuild";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace parcel::core
