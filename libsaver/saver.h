#include "libsaver/curve/G1Element.h"
#include "libsaver/curve/G2Element.h"
#include "libsaver/curve/Plaintext.h"
#include "libsaver/curve/FFT.h"
#include "libsaver/curve/Random.h"

#include "libsaver/zk/ConstraintSystem.h"
#include "libsaver/zk/Groth16.h"
#include "libsaver/zk/Parallel.h"

#include "libsaver/saver/Errors.h"
#include "libsaver/saver/Params.h"
#include "libsaver/saver/Decompose.h"
#include "libsaver/saver/Commitment.h"
#include "libsaver/saver/Circuit.h"
#include "libsaver/saver/Keys.h"
#include "libsaver/saver/Ciphertext.h"
#include "libsaver/saver/Encryption.h"

#include "libsaver/saveroffline/Equality_proof.h"
#include "libsaver/saveroffline/Equality_prover.h"
#include "libsaver/saveroffline/Equality_verifier.h"

#include "libsaver/saver_interface.hpp"
