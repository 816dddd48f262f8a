/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVME_STRUCTS_H
#define NVME_STRUCTS_H

#include <nvmecore/types.h>

// Layouts exchanged with the controller, see chapter 4 of the NVMe base
// specification. All fields are little endian.

enum nvme_io_opcode {
    NVME_CMD_FLUSH          = 0x00,
    NVME_CMD_WRITE          = 0x01,
    NVME_CMD_READ           = 0x02,
    NVME_CMD_WRITE_ZEROES   = 0x08,
    NVME_CMD_DSM            = 0x09,
};

enum nvme_status_code_type {
    NVME_SCT_GENERIC        = 0x0,
    NVME_SCT_COMMAND        = 0x1,
    NVME_SCT_MEDIA          = 0x2,
    NVME_SCT_PATH           = 0x3,
    NVME_SCT_VENDOR         = 0x7,
};

/// Command dword 0-9, common to all commands
typedef struct _nvme_command_common {
    u8                      opc;        ///< opcode
    u8                      fuse : 2;   ///< fused operation
    u8                      rsvd1 : 4;  ///< reserved
    u8                      psdt : 2;   ///< PRP or SGL for data transfer
    u16                     cid;        ///< command id
    u32                     nsid;       ///< namespace id
    u32                     cdw2;       ///< reserved (cdw 2)
    u32                     cdw3;       ///< reserved (cdw 3)
    u64                     mptr;       ///< metadata pointer
    u64                     prp1;       ///< PRP entry 1
    u64                     prp2;       ///< PRP entry 2
} nvme_command_common_t;

/// NVM command: read and write
typedef struct _nvme_command_rw {
    nvme_command_common_t   common;     ///< common cdw 0-9
    u64                     slba;       ///< starting LBA (cdw 10-11)
    u16                     nlb;        ///< number of logical blocks, 0's based (cdw 12:0-15)
    u16                     control;    ///< limited retry, FUA, ... (cdw 12:16-31)
    u32                     dsmgmt;     ///< dataset management (cdw 13)
    u32                     reftag;     ///< initial logical block reference tag (cdw 14)
    u16                     apptag;     ///< application tag (cdw 15:0-15)
    u16                     appmask;    ///< application tag mask (cdw 15:16-31)
} nvme_command_rw_t;

/// Admin and vendor specific command
typedef struct _nvme_command_vs {
    nvme_command_common_t   common;     ///< common cdw 0-9
    u32                     cdw10;
    u32                     cdw11;
    u32                     cdw12;
    u32                     cdw13;
    u32                     cdw14;
    u32                     cdw15;
} nvme_command_vs_t;

/// Submission queue entry
typedef union _nvme_sq_entry {
    nvme_command_common_t   common;     ///< fields every command has
    nvme_command_rw_t       rw;         ///< read/write command
    nvme_command_vs_t       vs;         ///< flush, admin and vendor specific commands
} nvme_sq_entry_t;

/// Completion queue entry
typedef struct _nvme_cq_entry {
    u32                     cs;         ///< command specific result
    u32                     rsvd;       ///< reserved
    u16                     sqhd;       ///< submission queue head
    u16                     sqid;       ///< submission queue id
    u16                     cid;        ///< command id
    union {
        u16                 psf;        ///< phase bit and status field
        struct {
            u16             p : 1;      ///< phase tag
            u16             sc : 8;     ///< status code
            u16             sct : 3;    ///< status code type
            u16             crd : 2;    ///< command retry delay
            u16             m : 1;      ///< more
            u16             dnr : 1;    ///< do not retry
        };
    };
} nvme_cq_entry_t;

/// Namespace attributes the I/O path needs
typedef struct _nvme_ns {
    u32                     id;         ///< namespace id
    u32                     blockshift; ///< log2 of the logical block size
    u64                     blockcount; ///< size in logical blocks
} nvme_ns_t;

static_assert(sizeof(nvme_command_common_t) == 40, "bad common command layout");
static_assert(sizeof(nvme_sq_entry_t) == 64, "submission entries are 64 bytes");
static_assert(sizeof(nvme_cq_entry_t) == 16, "completion entries are 16 bytes");

#endif
