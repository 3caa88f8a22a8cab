#pragma once

/*here you can choose the line store backend*/

#define IE_BACKEND_VECTOR 1
#define IE_BACKEND_GAP    2

#ifndef IE_BACKEND
#define IE_BACKEND IE_BACKEND_VECTOR
#endif

#if IE_BACKEND != IE_BACKEND_VECTOR && IE_BACKEND != IE_BACKEND_GAP
#error "IE_BACKEND must be IE_BACKEND_VECTOR or IE_BACKEND_GAP"
#endif

/*bytes buffered before each write(2) when saving*/
#ifndef IE_WRITE_CHUNK_SIZE
#define IE_WRITE_CHUNK_SIZE (64 * 1024)
#endif

/*rc file looked up in $HOME when $INIEDIT_RC is not set*/
#ifndef IE_RC_FILENAME
#define IE_RC_FILENAME ".inieditrc"
#endif
