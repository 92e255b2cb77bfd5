#include "chunkflow/transfer/transfer_types.hpp"

namespace chunkflow::transfer {

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "success";
        case TransferError::BUSY: return "busy";
        case TransferError::QUEUE_FULL: return "queue full";
        case TransferError::OUT_OF_RANGE: return "out of range";
        case TransferError::STORAGE_READ_FAILURE: return "storage read failure";
        case TransferError::REJECTED_FILE_TYPE: return "rejected file type";
        case TransferError::UNKNOWN_TRANSFER: return "unknown transfer";
        case TransferError::INVALID_STATE: return "invalid state";
        case TransferError::CANCELLED: return "cancelled";
        case TransferError::HASH_FAILED: return "hash failed";
    }
    return "unknown";
}

}
