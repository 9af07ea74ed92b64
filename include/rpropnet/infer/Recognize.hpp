#ifndef RPROPNET_INFER_RECOGNIZE_HPP
#define RPROPNET_INFER_RECOGNIZE_HPP

#ifdef __cplusplus
extern "C" {
#endif

#define RPROPNET_RECOGNIZE_WIDTH 28
#define RPROPNET_RECOGNIZE_HEIGHT 28
#define RPROPNET_RECOGNIZE_CLASSES 10

typedef struct rpropnet_guesses {
    double guesses[RPROPNET_RECOGNIZE_CLASSES];
} rpropnet_guesses;

/*
 * Scores one 28x28 grayscale image (row-major bytes) with the model stored at
 * model_path. Any failure, including null arguments, yields all zeros, so an
 * all-zero result cannot be told apart from a model with no confidence.
 */
rpropnet_guesses rpropnet_recognize(const char* model_path, const unsigned char* image);

#ifdef __cplusplus
}
#endif

#endif // RPROPNET_INFER_RECOGNIZE_HPP
